/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "codec/binwrite/endian.hpp"

namespace bw::codec::binwrite {
  /** Context passed down through every write call */
  struct WriterOption {
    Endian endian{Endian::kNative};
  };

  /** Option for a child whose declaration may override byte order */
  inline WriterOption resolve(const WriterOption &inherited,
                              const EndianOverride &override) {
    WriterOption child{inherited};
    child.endian = resolve(inherited.endian, override);
    return child;
  }
}  // namespace bw::codec::binwrite
