/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/program_options/errors.hpp>
#include <boost/program_options/value_semantic.hpp>

#define CLI_VALIDATE(TYPE) \
  inline void validate(    \
      boost::any &out, const std::vector<std::string> &values, TYPE *, int)

namespace fibon {
  /**
   * Converts single option value with f, conversion error is reported as
   * invalid option value
   */
  template <typename F>
  void validateWith(boost::any &out,
                    const std::vector<std::string> &values,
                    const F &f) {
    namespace po = boost::program_options;
    po::check_first_occurrence(out);
    const auto &value{po::get_single_string(values)};
    auto converted{f(value)};
    if (!converted) {
      boost::throw_exception(po::invalid_option_value{value});
    }
    out = std::move(converted.value());
  }
}  // namespace fibon
