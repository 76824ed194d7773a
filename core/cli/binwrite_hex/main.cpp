/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include <cstdlib>
#include <iostream>

#include <boost/program_options.hpp>
#include <spdlog/fmt/fmt.h>

#include "cli/validate/binwrite.hpp"
#include "codec/binwrite/binwrite.hpp"
#include "common/hexutil.hpp"
#include "common/logger.hpp"
#include "config/encoder_config.hpp"

namespace {
  namespace po = boost::program_options;
  using bw::codec::binwrite::PrimitiveType;
  using bw::codec::binwrite::Value;

  auto log() {
    static bw::common::Logger logger =
        bw::common::createLogger("binwrite_hex");
    return logger.get();
  }
}  // namespace

int main(int argc, char *argv[]) {
  bw::codec::binwrite::WriterOption option;
  PrimitiveType type{PrimitiveType::kU8};
  std::vector<std::string> raw_values;

  po::options_description desc("binwrite_hex options");
  desc.add_options()("help,h", "print usage message")(
      "type,t",
      po::value(&type)->default_value(type, "u8"),
      "element type, [u8,i8,u16,i16,u32,i32,u64,i64,f32,f64]")(
      "values", po::value(&raw_values)->composing(), "values to encode");
  desc.add(bw::config::configEncoder(option));

  po::positional_options_description positional;
  positional.add("values", -1);

  po::variables_map vm;
  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(desc)
                  .positional(positional)
                  .run(),
              vm);
    po::notify(vm);
  } catch (const po::error &e) {
    std::cerr << "Cannot parse options: " << e.what() << "\n";
    return EXIT_FAILURE;
  }
  if (vm.count("help") != 0) {
    std::cout << desc << "\n";
    return EXIT_SUCCESS;
  }

  std::vector<Value> values;
  values.reserve(raw_values.size());
  for (const auto &raw : raw_values) {
    auto value{bw::codec::binwrite::parsePrimitive(type, raw)};
    if (!value) {
      log()->error("invalid {} value '{}'",
                   bw::common::to_string(type).value_or("?"),
                   raw);
      return EXIT_FAILURE;
    }
    values.push_back(std::move(*value));
  }

  OUTCOME_EXCEPT(sequence, Value::makeSequence(std::move(values)));
  bw::Bytes bytes;
  bw::codec::binwrite::BytesSink sink{bytes};
  OUTCOME_EXCEPT(bw::codec::binwrite::encode(sequence, sink, option));
  log()->debug("encoded {} values into {} bytes",
               raw_values.size(),
               bytes.size());
  fmt::print("{}\n", bw::common::hex_lower(bytes));
  return EXIT_SUCCESS;
}
