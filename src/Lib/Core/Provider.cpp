#include <CCStatus/Core/Provider.hpp>

#include <CCStatus/Utils/Logging.hpp>

namespace ccstatus::core::provider {
  using namespace ccstatus::utils::types;

  FieldMapProvider::FieldMapProvider(String providerId)
    : m_id(std::move(providerId)) {}

  auto FieldMapProvider::getId() const -> StringView {
    return m_id;
  }

  auto FieldMapProvider::getInteger(const StringView key) const -> Option<i64> {
    if (const auto iter = m_integers.find(String(key)); iter != m_integers.end())
      return iter->second;

    return None;
  }

  auto FieldMapProvider::getNumber(const StringView key) const -> Option<f64> {
    if (const auto iter = m_numbers.find(String(key)); iter != m_numbers.end())
      return iter->second;

    if (const Option<i64> integer = getInteger(key))
      return static_cast<f64>(*integer);

    return None;
  }

  auto FieldMapProvider::getText(const StringView key) const -> Option<String> {
    if (const auto iter = m_texts.find(String(key)); iter != m_texts.end())
      return iter->second;

    return None;
  }

  auto FieldMapProvider::getLastError() const -> const Option<error::StatusError>& {
    return m_lastError;
  }

  auto FieldMapProvider::setInteger(const StringView key, const i64 value) -> Unit {
    m_integers.insert_or_assign(String(key), value);
  }

  auto FieldMapProvider::setNumber(const StringView key, const f64 value) -> Unit {
    m_numbers.insert_or_assign(String(key), value);
  }

  auto FieldMapProvider::setText(const StringView key, String value) -> Unit {
    m_texts.insert_or_assign(String(key), std::move(value));
  }

  auto FieldMapProvider::setLastError(error::StatusError err) -> Unit {
    debug_log("{}: {}", m_id, err.message);
    m_lastError = std::move(err);
  }

  auto FieldMapProvider::integerOr0(const StringView key) const -> i64 {
    return getInteger(key).value_or(0);
  }

  auto FieldMapProvider::empty() const -> bool {
    return m_integers.empty() && m_numbers.empty() && m_texts.empty();
  }
} // namespace ccstatus::core::provider
