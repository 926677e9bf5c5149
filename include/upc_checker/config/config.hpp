// Copyright (c) 2024 UPC Checker
// Licensed under the Apache License, Version 2.0

#ifndef UPC_CHECKER__CONFIG__CONFIG_HPP_
#define UPC_CHECKER__CONFIG__CONFIG_HPP_

#pragma once

#include <string>
#include <stdexcept>

#include "upc_checker/checksum/upc_code.hpp"
#include "upc_checker/text/code_reader.hpp"

namespace upc_checker
{
namespace config
{

struct Config
{
  std::string standard = "upc_a";
  std::string separators = " -";
  bool quiet = false;
  std::string log_level = "info";

  // Throws std::runtime_error if standard is not supported
  checksum::Standard barcode_standard() const;

  text::ReadOptions reader_options() const;

  void validate() const;
};

Config parse_from_yaml_file(const std::string & path);
Config parse_from_yaml_string(const std::string & yaml);

} // namespace config
} // namespace upc_checker

#endif  // UPC_CHECKER__CONFIG__CONFIG_HPP_
