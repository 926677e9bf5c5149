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

#include <iostream>
#include <string>

#include <rclcpp/rclcpp.hpp>

#include "upc_checker/config/config.hpp"
#include "upc_checker/tool/run.hpp"

namespace
{

rclcpp::Logger logger()
{
  return rclcpp::get_logger("upc_check");
}

rclcpp::Logger::Level to_logger_level(const std::string & level)
{
  if (level == "debug") {return rclcpp::Logger::Level::Debug;}
  if (level == "warn") {return rclcpp::Logger::Level::Warn;}
  if (level == "error") {return rclcpp::Logger::Level::Error;}
  return rclcpp::Logger::Level::Info;
}

void print_usage(const char * prog)
{
  std::cerr << "usage: " << prog << " [--config <file>] <code>" << std::endl;
}

}  // namespace

int main(int argc, char ** argv)
{
  namespace tool = upc_checker::tool;

  tool::Arguments args;
  std::string error;
  if (!tool::parse_arguments(argc, argv, args, error)) {
    RCLCPP_ERROR(logger(), "%s", error.c_str());
    print_usage(argv[0]);
    return tool::EXIT_USAGE;
  }
  if (args.help) {
    print_usage(argv[0]);
    return tool::EXIT_VALID;
  }

  upc_checker::config::Config cfg;
  if (!args.config_path.empty() &&
    tool::load_config(args.config_path, cfg, error) != tool::EXIT_VALID)
  {
    RCLCPP_ERROR(logger(), "%s", error.c_str());
    return tool::EXIT_USAGE;
  }

  logger().set_level(to_logger_level(cfg.log_level));
  RCLCPP_DEBUG(
    logger(), "standard=%s separators='%s' quiet=%s",
    cfg.standard.c_str(), cfg.separators.c_str(), cfg.quiet ? "true" : "false");

  const int status = tool::run(cfg, args.code, std::cout, error);
  if (status == tool::EXIT_MALFORMED) {
    RCLCPP_ERROR(logger(), "%s", error.c_str());
  }
  return status;
}
