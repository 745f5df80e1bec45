/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <type_traits>

#include <boost/assert.hpp>

namespace rampart {
  /**
   * Nullable reference, returned by lookups into an immutable structure
   */
  template <typename T>
  class OptRef {
   public:
    OptRef() : data{nullptr} {}
    OptRef(T &data) : data{&data} {}
    OptRef(T &&) = delete;
    OptRef(std::nullopt_t) : data{nullptr} {}

    OptRef(const OptRef &) = default;

    OptRef &operator=(const OptRef &) = default;

    T &operator*() const {
      BOOST_ASSERT(data);
      return *data;
    }

    T *operator->() const {
      BOOST_ASSERT(data);
      return data;
    }

    T &value() const {
      BOOST_ASSERT(data);
      return *data;
    }

    explicit operator bool() const {
      return data != nullptr;
    }

    bool operator!() const {
      return data == nullptr;
    }

    bool has_value() const {
      return data != nullptr;
    }

    bool operator==(const OptRef<T> &) const = default;

   private:
    T *data;
  };
}  // namespace rampart
