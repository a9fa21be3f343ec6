/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "config/signer_conf_loader.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <initializer_list>
#include <map>
#include <optional>
#include <stdexcept>
#include <string_view>

#include <fmt/core.h>
#include <fmt/format.h>
#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <boost/range/adaptor/map.hpp>
#include "common/files.hpp"
#include "common/result.hpp"
#include "config/signer_conf_literals.hpp"

/// The length of the string around the error place to print in case of JSON
/// syntax error.
static constexpr size_t kBadJsonPrintLength = 15;

/// The offset of printed chunk towards file start from the error position.
static constexpr size_t kBadJsonPrintOffsset = 5;

static_assert(kBadJsonPrintOffsset <= kBadJsonPrintLength,
              "The place of error is out of the printed string boundaries!");

class ConfigParsingException : public std::runtime_error {
  using std::runtime_error::runtime_error;
};

/**
 * Throws a runtime exception if the given condition is false.
 * @param condition
 * @param printable_path - path of the offending value in the document
 * @param error - error message
 */
inline void assert_fatal(bool condition,
                         std::string_view printable_path,
                         std::string error) {
  if (!condition) {
    throw ConfigParsingException(fmt::format("{}: {}", printable_path, error));
  }
}

/**
 * Reads values from a JSON node, remembering where the node is to name it in
 * errors.
 */
class JsonDeserializer {
 public:
  JsonDeserializer(rapidjson::Value const &json, std::string printable_path)
      : json_(json), printable_path_(std::move(printable_path)) {}

  std::optional<JsonDeserializer> getOptChild(char const *key) const {
    assert_fatal(json_.IsObject(), "must be a JSON object.");
    auto const it = json_.FindMember(key);
    if (it == json_.MemberEnd()) {
      return std::nullopt;
    }
    return JsonDeserializer{it->value,
                            fmt::format("{}/{}", printable_path_, key)};
  }

  JsonDeserializer getChild(char const *key) const {
    auto child = getOptChild(key);
    assert_fatal(child.has_value(),
                 fmt::format("required member `{}' is missing", key));
    return *std::move(child);
  }

  /// Fails on members that are not in @a known
  void checkMembers(std::initializer_list<char const *> known) const {
    assert_fatal(json_.IsObject(), "must be a JSON object.");
    for (auto const &member : json_.GetObject()) {
      std::string_view const name = member.name.GetString();
      assert_fatal(
          std::any_of(known.begin(),
                      known.end(),
                      [&](char const *key) { return name == key; }),
          fmt::format("unknown member `{}'", name));
    }
  }

  std::string getString() const {
    assert_fatal(json_.IsString(), "must be a string");
    return json_.GetString();
  }

  uint64_t getUint64() const {
    assert_fatal(json_.IsUint64(), "must be an unsigned integer");
    return json_.GetUint64();
  }

  double getDouble() const {
    assert_fatal(json_.IsNumber(), "must be a number");
    return json_.GetDouble();
  }

  /// Look the string value up in @a values
  template <typename T>
  T getOneOf(std::map<std::string, T> const &values) const {
    auto const name = getString();
    auto const it = values.find(name);
    assert_fatal(it != values.end(),
                 fmt::format("wrong value `{}': must be one of `{}'",
                             name,
                             fmt::join(values | boost::adaptors::map_keys,
                                       "', `")));
    return it->second;
  }

  inline void assert_fatal(bool condition, std::string error) const {
    ::assert_fatal(condition, printable_path_, std::move(error));
  }

 private:
  rapidjson::Value const &json_;
  std::string printable_path_;
};

namespace {
  kmsign::kms::RetryPolicy parseRetryPolicy(JsonDeserializer const &json) {
    using namespace config_members;
    json.checkMembers(
        {MaxAttempts, BaseDelayMs, MaxDelayMs, MaxElapsedMs, BackoffFactor});

    kmsign::kms::RetryPolicy policy;
    if (auto value = json.getOptChild(MaxAttempts)) {
      policy.max_attempts = value->getUint64();
      value->assert_fatal(policy.max_attempts > 0, "must be at least 1");
    }
    if (auto value = json.getOptChild(BaseDelayMs)) {
      policy.base_delay = std::chrono::milliseconds(value->getUint64());
    }
    if (auto value = json.getOptChild(MaxDelayMs)) {
      policy.max_delay = std::chrono::milliseconds(value->getUint64());
      value->assert_fatal(policy.max_delay >= policy.base_delay,
                          "must not be less than base_delay_ms");
    }
    if (auto value = json.getOptChild(MaxElapsedMs)) {
      policy.max_elapsed = std::chrono::milliseconds(value->getUint64());
    }
    if (auto value = json.getOptChild(BackoffFactor)) {
      policy.backoff_factor = value->getDouble();
      value->assert_fatal(policy.backoff_factor >= 1.0,
                          "must be at least 1.0");
    }
    return policy;
  }

  kmsign::SignerConfig parseSignerConfigDocument(
      rapidjson::Document const &doc) {
    using namespace config_members;
    JsonDeserializer const root{doc, ""};
    root.checkMembers({Key, Digest, RsaPadding, LogLevel, Retry});

    kmsign::SignerConfig config;
    auto key = root.getChild(Key);
    config.key = key.getString();
    key.assert_fatal(not config.key.empty(), "must not be empty");

    if (auto digest = root.getOptChild(Digest)) {
      config.scheme.digest = digest->getOneOf(Digests);
    }
    if (auto padding = root.getOptChild(RsaPadding)) {
      config.scheme.rsa_padding = padding->getOneOf(RsaPaddings);
    }
    if (auto log_level = root.getOptChild(LogLevel)) {
      config.log_level = log_level->getOneOf(LogLevels);
    }
    if (auto retry = root.getOptChild(Retry)) {
      config.retry = parseRetryPolicy(*retry);
    }
    return config;
  }

  void reportJsonParsingError(const rapidjson::Document &doc,
                              const std::string &text) {
    if (doc.HasParseError()) {
      const size_t error_offset = doc.GetErrorOffset();
      // This ensures the unsigned string beginning position does not cross
      // zero:
      const size_t print_offset =
          std::max(error_offset, kBadJsonPrintOffsset) - kBadJsonPrintOffsset;
      std::string json_error_buf =
          text.substr(std::min(print_offset, text.size()), kBadJsonPrintLength);
      throw ConfigParsingException{fmt::format(
          "JSON parse error (near `{}'): {}",
          json_error_buf,
          std::string(rapidjson::GetParseError_En(doc.GetParseError())))};
    }
  }
}  // namespace

kmsign::expected::Result<kmsign::SignerConfig, std::string>
kmsign::parseSignerConfig(std::string const &json) {
  try {
    rapidjson::Document doc;
    doc.Parse(json.c_str());
    reportJsonParsingError(doc, json);
    return expected::makeValue(parseSignerConfigDocument(doc));
  } catch (ConfigParsingException const &e) {
    return expected::makeError(std::string{e.what()});
  }
}

kmsign::expected::Result<kmsign::SignerConfig, std::string>
kmsign::loadSignerConfig(std::string const &path) {
  return readTextFile(path) |
      [](std::string text) { return parseSignerConfig(text); };
}
