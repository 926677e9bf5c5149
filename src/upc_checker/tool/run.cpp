/*
 * Copyright (c) 2024 UPC Checker Project
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include "upc_checker/tool/run.hpp"

#include <stdexcept>

#include "upc_checker/checksum/upc_code.hpp"
#include "upc_checker/text/code_reader.hpp"

namespace upc_checker
{
namespace tool
{

bool parse_arguments(int argc, const char * const * argv, Arguments & args, std::string & error)
{
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config") {
      if (i + 1 >= argc) {
        error = "--config requires a file";
        return false;
      }
      args.config_path = argv[++i];
    } else if (arg == "-h" || arg == "--help") {
      args.help = true;
      return true;
    } else if (args.code.empty()) {
      args.code = arg;
    } else {
      // One code per invocation
      error = "unexpected argument: " + arg;
      return false;
    }
  }

  if (args.code.empty()) {
    error = "missing code";
    return false;
  }
  return true;
}

int load_config(const std::string & path, config::Config & cfg, std::string & error)
{
  try {
    cfg = config::parse_from_yaml_file(path);
  } catch (const std::runtime_error & e) {
    error = "failed to load config " + path + ": " + e.what();
    return EXIT_USAGE;
  }
  return EXIT_VALID;
}

int run(
  const config::Config & cfg, const std::string & code_text, std::ostream & out,
  std::string & error)
{
  checksum::UpcCode code;
  const auto read_result = text::tryReadCode(code_text, cfg.reader_options(), code);
  if (read_result != text::ReadResult::SUCCESS) {
    error = "cannot read code '" + code_text + "': " + text::to_string(read_result);
    return EXIT_MALFORMED;
  }

  bool is_valid = false;
  const auto err = checksum::validate(code, is_valid);
  if (err != checksum::ErrorCode::OK) {
    error = "cannot validate code '" + code_text + "': " + checksum::to_string(err);
    return EXIT_MALFORMED;
  }

  if (!cfg.quiet) {
    out << code_text << ": " << (is_valid ? "valid" : "invalid") << std::endl;
  }
  return is_valid ? EXIT_VALID : EXIT_INVALID;
}

} // namespace tool
} // namespace upc_checker
