/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "codec/value.hpp"

#include <algorithm>
#include <ostream>

namespace rampart::codec {

  namespace {
    template <class... Ts>
    struct overloaded : Ts... {
      using Ts::operator()...;
    };

    void printComposite(std::ostream &os, const Composite &composite) {
      auto named = composite.isNamed();
      os << (named ? "{ " : "(");
      for (size_t i = 0; i < composite.values.size(); ++i) {
        if (i != 0) {
          os << ", ";
        }
        if (named) {
          os << composite.names[i] << ": ";
        }
        os << composite.values[i];
      }
      os << (named ? " }" : ")");
    }
  }  // namespace

  const Value *Composite::field(std::string_view name) const {
    auto it = std::find(names.begin(), names.end(), name);
    if (it == names.end()) {
      return nullptr;
    }
    return &values[std::distance(names.begin(), it)];
  }

  Composite namedComposite(std::vector<std::pair<std::string, Value>> fields) {
    Composite composite;
    composite.names.reserve(fields.size());
    composite.values.reserve(fields.size());
    for (auto &[name, value] : fields) {
      composite.names.emplace_back(std::move(name));
      composite.values.emplace_back(std::move(value));
    }
    return composite;
  }

  Value Value::named(std::vector<std::pair<std::string, Value>> fields) {
    return {namedComposite(std::move(fields))};
  }

  Value Value::unnamed(std::vector<Value> values) {
    return {Composite{{}, std::move(values)}};
  }

  Value Value::variant(std::string name, Composite values) {
    return {VariantValue{std::move(name), std::move(values)}};
  }

  std::ostream &operator<<(std::ostream &os, const Value &value) {
    std::visit(
        overloaded{
            [&](const Composite &composite) { printComposite(os, composite); },
            [&](const VariantValue &variant) {
              os << variant.name << ' ';
              printComposite(os, variant.values);
            },
            [&](const BitSequence &bits) {
              os << "0b";
              for (auto bit : bits) {
                os << (bit ? '1' : '0');
              }
            },
            [&](const Primitive &primitive) {
              std::visit(overloaded{
                             [&](bool v) { os << (v ? "true" : "false"); },
                             [&](char32_t v) {
                               os << "'\\u{" << std::hex
                                  << static_cast<uint32_t>(v) << std::dec
                                  << "}'";
                             },
                             [&](const std::string &v) {
                               os << '"' << v << '"';
                             },
                             [&](const auto &v) { os << v; },
                         },
                         primitive);
            },
        },
        value.value);
    return os;
  }

}  // namespace rampart::codec
