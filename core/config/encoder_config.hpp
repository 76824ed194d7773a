/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/program_options.hpp>

#include "codec/binwrite/writer_option.hpp"

namespace bw::config {
  using boost::program_options::options_description;

  /**
   * Creates program option description for encoder byte order and log
   * level. Values are applied by notifiers once options are parsed.
   *
   * @param option - receives byte order from '--endian'
   * @return encoder program option description
   */
  options_description configEncoder(codec::binwrite::WriterOption &option);
}  // namespace bw::config
