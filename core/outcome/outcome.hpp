/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <system_error>
#include <type_traits>

#include <boost/outcome/std_result.hpp>
#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

namespace rampart::outcome {

  using BOOST_OUTCOME_V2_NAMESPACE::failure;
  using BOOST_OUTCOME_V2_NAMESPACE::success;

  template <class R, class S = std::error_code>
  using result = BOOST_OUTCOME_V2_NAMESPACE::std_result<R, S>;

}  // namespace rampart::outcome

namespace rampart::outcome::detail {

  /**
   * Error category of a single error enum. Its messages come from the
   * function written right after OUTCOME_CPP_DEFINE_CATEGORY.
   */
  template <typename Enum>
  class Category final : public std::error_category {
   public:
    using MessageFn = std::string (*)(Enum);

    Category(const char *name, MessageFn message_fn)
        : name_{name}, message_fn_{message_fn} {}

    const char *name() const noexcept override {
      return name_;
    }

    std::string message(int c) const override {
      return message_fn_(static_cast<Enum>(c));
    }

   private:
    const char *name_;
    MessageFn message_fn_;
  };

}  // namespace rampart::outcome::detail

#define OUTCOME_TRY BOOST_OUTCOME_TRY

#define OUTCOME_UNIQUE BOOST_OUTCOME_TRY_UNIQUE_NAME

/// MUST BE EXECUTED AT FILE LEVEL (no namespace) IN HPP
#define OUTCOME_HPP_DECLARE_ERROR(ns, Enum)                   \
  namespace ns {                                              \
    std::error_code make_error_code(Enum e);                  \
  }                                                           \
  template <>                                                 \
  struct std::is_error_code_enum<ns::Enum> : std::true_type {};

/// MUST BE EXECUTED AT FILE LEVEL (no namespace) IN CPP
#define OUTCOME_CPP_DEFINE_CATEGORY(ns, Enum, Name)                           \
  static std::string rampart_error_message_##Enum(ns::Enum);                  \
  namespace ns {                                                              \
    std::error_code make_error_code(Enum e) {                                 \
      static const ::rampart::outcome::detail::Category<Enum> category{       \
          #ns "::" #Enum, &rampart_error_message_##Enum};                     \
      return {static_cast<int>(e), category};                                 \
    }                                                                         \
  }                                                                           \
  static std::string rampart_error_message_##Enum(ns::Enum Name)
