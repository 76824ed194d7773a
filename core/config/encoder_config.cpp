/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "config/encoder_config.hpp"

#include "cli/validate/binwrite.hpp"
#include "common/logger.hpp"

namespace bw::config {
  using codec::binwrite::Endian;

  options_description configEncoder(codec::binwrite::WriterOption &option) {
    options_description optionsDescription("Encoder options");
    optionsDescription.add_options()(
        "endian",
        boost::program_options::value<Endian>()
            ->default_value(option.endian,
                            std::string{common::to_string(option.endian)
                                            .value_or("native")})
            ->notifier([&option](Endian endian) { option.endian = endian; }),
        "Default byte order of multi-byte values. Supported orders: \n"
        " * 'big'\n"
        " * 'little'\n"
        " * 'native' - byte order of this host\n");
    optionsDescription.add_options()(
        "log,l",
        boost::program_options::value<char>()->default_value('i')->notifier(
            [](char level) { spdlog::set_level(common::getLogLevel(level)); }),
        "log level, [e,w,i,d,t]");

    return optionsDescription;
  }
}  // namespace bw::config
