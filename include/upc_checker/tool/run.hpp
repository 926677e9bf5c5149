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

#ifndef UPC_CHECKER__TOOL__RUN_HPP_
#define UPC_CHECKER__TOOL__RUN_HPP_

#pragma once

#include <ostream>
#include <string>

#include "upc_checker/config/config.hpp"

namespace upc_checker
{
namespace tool
{

// Exit codes of upc_check
static constexpr int EXIT_VALID = 0;
static constexpr int EXIT_INVALID = 1;
static constexpr int EXIT_MALFORMED = 2;
static constexpr int EXIT_USAGE = 3;

struct Arguments
{
  std::string config_path;
  std::string code;
  bool help = false;
};

/**
 * @brief Parse `[--config <file>] <code>`
 *
 * @param argc Argument count, argv[0] is the program name
 * @param argv Argument vector
 * @param args Receives the parsed arguments
 * @param error Receives a message when parsing fails
 * @return false on a usage error (missing code, second code, --config without a value)
 */
bool parse_arguments(int argc, const char * const * argv, Arguments & args, std::string & error);

/**
 * @brief Load the config file named on the command line
 *
 * @return EXIT_VALID on success, EXIT_USAGE with error set otherwise
 */
int load_config(const std::string & path, config::Config & cfg, std::string & error);

/**
 * @brief Read and validate one code, printing the verdict to out unless quiet
 *
 * @param cfg Settings
 * @param code_text Printed code
 * @param out Verdict stream
 * @param error Receives a message when the code cannot be read or validated
 * @return EXIT_VALID, EXIT_INVALID or EXIT_MALFORMED
 */
int run(
  const config::Config & cfg, const std::string & code_text, std::ostream & out,
  std::string & error);

} // namespace tool
} // namespace upc_checker

#endif  // UPC_CHECKER__TOOL__RUN_HPP_
