/**
 * @file ArgumentParser.hpp
 * @brief Small fluent command-line parser.
 *
 * Arguments are registered with addArguments() and configured by chaining
 * (help(), flag(), defaultValue(), bindTo()). An enum default also restricts
 * the accepted values to the enum's names. After parseInto() every bound
 * member holds its parsed value or its default.
 *
 * -h/--help and -v/--version are always registered. Parsing them only sets a
 * flag; the caller decides what to print and when to exit.
 */

#pragma once

#include <algorithm>                 // std::ranges::contains
#include <concepts>                  // std::convertible_to, std::same_as
#include <format>                    // std::format
#include <functional>                // std::function
#include <magic_enum/magic_enum.hpp> // magic_enum::enum_name, magic_enum::enum_values
#include <utility>                   // std::forward
#include <variant>                   // std::variant, std::get, std::holds_alternative

#include "Error.hpp"
#include "Logging.hpp"
#include "Strings.hpp"
#include "Types.hpp"

namespace ccstatus::utils::argparse {
  namespace error   = ::ccstatus::utils::error;
  namespace logging = ::ccstatus::utils::logging;
  namespace types   = ::ccstatus::utils::types;

  using strings::ToLower;

  class Argument;

  using ArgValue   = std::variant<bool, types::String>;
  using ArgBinding = std::function<void(const Argument&)>;
  using ArgChoices = types::Vec<types::String>;

  /**
   * @brief Enum <-> string conversion for choice arguments, via magic_enum.
   */
  template <typename EnumType>
  struct EnumTraits {
    static constexpr bool has_string_conversion = magic_enum::is_scoped_enum_v<EnumType>;

    static auto getChoices() -> const ArgChoices& {
      static const ArgChoices CACHED_CHOICES = [] {
        ArgChoices vec;
        for (const auto value : magic_enum::enum_values<EnumType>())
          vec.emplace_back(ToLower(magic_enum::enum_name(value)));
        return vec;
      }();

      return CACHED_CHOICES;
    }

    /// Case-insensitive lookup; falls back to the first enumerator.
    static auto stringToEnum(types::StringView str) -> EnumType {
      const auto enumValues = magic_enum::enum_values<EnumType>();

      for (const auto value : enumValues)
        if (ToLower(magic_enum::enum_name(value)) == ToLower(str))
          return value;

      return enumValues[0];
    }
  };

  /**
   * @brief One command-line argument with its aliases, metadata and value.
   */
  class Argument {
   public:
    template <typename... NameTs>
      requires(sizeof...(NameTs) >= 1 && (std::convertible_to<NameTs, types::String> && ...))
    explicit Argument(NameTs&&... names)
      : m_names { types::String(std::forward<NameTs>(names))... } {}

    auto help(types::String helpText) -> Argument& {
      m_helpText = std::move(helpText);
      return *this;
    }

    auto flag() -> Argument& {
      m_isFlag       = true;
      m_defaultValue = false;
      return *this;
    }

    auto defaultValue(types::String value) -> Argument& {
      m_defaultValue = std::move(value);
      return *this;
    }

    auto defaultValue(types::PCStr value) -> Argument& {
      return defaultValue(types::String(value));
    }

    auto defaultValue(bool value) -> Argument& {
      m_defaultValue = value;
      return *this;
    }

    template <typename EnumType>
      requires std::is_enum_v<EnumType> && EnumTraits<EnumType>::has_string_conversion
    auto defaultValue(EnumType value) -> Argument& {
      m_defaultValue = ToLower(magic_enum::enum_name(value));
      m_choices      = EnumTraits<EnumType>::getChoices();
      return *this;
    }

    template <typename T>
    auto get() const -> T {
      if (m_value && std::holds_alternative<T>(*m_value))
        return std::get<T>(*m_value);

      if (m_defaultValue && std::holds_alternative<T>(*m_defaultValue))
        return std::get<T>(*m_defaultValue);

      return T {};
    }

    template <typename EnumType>
      requires std::is_enum_v<EnumType> && EnumTraits<EnumType>::has_string_conversion
    auto getEnum() const -> EnumType {
      return EnumTraits<EnumType>::stringToEnum(get<types::String>());
    }

    [[nodiscard]] auto isUsed() const -> bool {
      return m_isUsed;
    }

    [[nodiscard]] auto isFlag() const -> bool {
      return m_isFlag;
    }

    [[nodiscard]] auto getPrimaryName() const -> const types::String& {
      return m_names.front();
    }

    [[nodiscard]] auto getNames() const -> const types::Vec<types::String>& {
      return m_names;
    }

    [[nodiscard]] auto getHelpText() const -> const types::String& {
      return m_helpText;
    }

    [[nodiscard]] auto getChoices() const -> ArgChoices {
      return m_choices.value_or(ArgChoices {});
    }

    [[nodiscard]] auto getDefaultAsString() const -> types::String {
      if (!m_defaultValue || std::holds_alternative<bool>(*m_defaultValue))
        return {};

      return std::get<types::String>(*m_defaultValue);
    }

    /**
     * @brief Stores a value given on the command line, validating choices.
     */
    auto setValue(types::String value) -> types::Result<> {
      if (m_choices && !std::ranges::contains(*m_choices, ToLower(value))) {
        types::String allowed;
        for (const types::String& choice : *m_choices)
          allowed += (allowed.empty() ? "" : ", ") + choice;

        ERR_FMT(error::StatusErrorCode::InvalidArgument, "Invalid value '{}' for argument '{}'. Allowed values: {}", value, getPrimaryName(), allowed);
      }

      m_value  = std::move(value);
      m_isUsed = true;
      return {};
    }

    auto markUsed() -> types::Unit {
      m_isUsed = true;

      if (m_isFlag)
        m_value = true;
    }

    /**
     * @brief Binds the argument to a struct member, assigned by applyBinding().
     *
     * @example
     *   struct Options { bool json; String theme; };
     *   parser.addArguments("--json").flag().bindTo(opts.json);
     *   parser.addArguments("-t", "--theme").defaultValue("").bindTo(opts.theme);
     */
    template <typename T>
      requires std::same_as<T, bool> || std::same_as<T, types::String>
    auto bindTo(T& member) -> Argument& {
      m_binding = [&member](const Argument& arg) -> void { member = arg.get<T>(); };
      return *this;
    }

    template <typename EnumType>
      requires std::is_enum_v<EnumType> && EnumTraits<EnumType>::has_string_conversion
    auto bindToEnum(EnumType& member) -> Argument& {
      m_binding = [&member](const Argument& arg) -> void { member = arg.getEnum<EnumType>(); };
      return *this;
    }

    auto applyBinding() const -> types::Unit {
      if (m_binding)
        m_binding(*this);
    }

   private:
    types::Vec<types::String> m_names;
    types::String             m_helpText;
    types::Option<ArgValue>   m_value;
    types::Option<ArgValue>   m_defaultValue;
    types::Option<ArgChoices> m_choices;
    ArgBinding                m_binding;
    bool                      m_isFlag {};
    bool                      m_isUsed {};
  };

  /**
   * @brief Fluent command-line parser.
   */
  class ArgumentParser {
   public:
    ArgumentParser(types::String programName, types::String version)
      : m_programName(std::move(programName)), m_version(std::move(version)) {
      addArguments("-h", "--help").help("Show this help message and exit").flag();
      addArguments("-v", "--version").help("Show version information and exit").flag();
    }

    template <typename... NameTs>
      requires(sizeof...(NameTs) >= 1 && (std::convertible_to<NameTs, types::String> && ...))
    auto addArguments(NameTs&&... names) -> Argument& {
      m_arguments.emplace_back(std::make_unique<Argument>(std::forward<NameTs>(names)...));
      Argument& arg = *m_arguments.back();

      for (const types::String& name : arg.getNames())
        m_argumentMap[name] = &arg;

      return arg;
    }

    /**
     * @brief Parses @p args (argv-style, program name first).
     * @return InvalidArgument on unknown arguments, missing values or
     *         disallowed choices.
     */
    auto parseArgs(types::Span<const types::PCStr> args) -> types::Result<> {
      for (types::usize i = 1; i < args.size(); ++i) {
        const types::StringView arg = args[i];

        auto iter = m_argumentMap.find(arg);
        if (iter == m_argumentMap.end())
          ERR_FMT(error::StatusErrorCode::InvalidArgument, "Unknown argument: {}", arg);

        Argument* argument = iter->second;

        if (argument->isFlag()) {
          argument->markUsed();
          continue;
        }

        if (i + 1 >= args.size())
          ERR_FMT(error::StatusErrorCode::InvalidArgument, "Argument {} requires a value", arg);

        TRY_VOID(argument->setValue(args[++i]));
      }

      return {};
    }

    /**
     * @brief parseArgs() followed by applying every binding.
     */
    auto parseInto(types::Span<const types::PCStr> args) -> types::Result<> {
      TRY_VOID(parseArgs(args));

      for (const auto& arg : m_arguments)
        arg->applyBinding();

      return {};
    }

    template <typename T = types::String>
    auto get(types::StringView name) const -> T {
      if (auto iter = m_argumentMap.find(name); iter != m_argumentMap.end())
        return iter->second->get<T>();

      return T {};
    }

    template <typename EnumType>
    auto getEnum(types::StringView name) const -> EnumType {
      if (auto iter = m_argumentMap.find(name); iter != m_argumentMap.end())
        return iter->second->getEnum<EnumType>();

      return EnumTraits<EnumType>::stringToEnum("");
    }

    [[nodiscard]] auto isUsed(types::StringView name) const -> bool {
      auto iter = m_argumentMap.find(name);
      return iter != m_argumentMap.end() && iter->second->isUsed();
    }

    [[nodiscard]] auto helpRequested() const -> bool {
      return isUsed("--help");
    }

    [[nodiscard]] auto versionRequested() const -> bool {
      return isUsed("--version");
    }

    [[nodiscard]] auto getVersion() const -> const types::String& {
      return m_version;
    }

    [[nodiscard]] auto helpText() const -> types::String {
      types::String text = std::format("Usage: {}", m_programName);

      for (const auto& arg : m_arguments)
        text += std::format(" [{}{}]", arg->getPrimaryName(), arg->isFlag() ? "" : " VALUE");

      text += "\n\nArguments:\n";

      for (const auto& arg : m_arguments) {
        types::String names;
        for (const types::String& name : arg->getNames())
          names += (names.empty() ? "" : ", ") + name;

        text += std::format("  {}{}\n", names, arg->isFlag() ? "" : " VALUE");

        if (!arg->getHelpText().empty())
          text += std::format("    {}\n", arg->getHelpText());

        if (const ArgChoices choices = arg->getChoices(); !choices.empty()) {
          types::String joined;
          for (const types::String& choice : choices)
            joined += (joined.empty() ? "" : ", ") + choice;

          text += std::format("    Available values: {}\n", joined);
        }

        if (const types::String def = arg->getDefaultAsString(); !def.empty())
          text += std::format("    Default: {}\n", def);
      }

      return text;
    }

    auto printHelp() const -> types::Unit {
      logging::Print(helpText());
    }

   private:
    types::String                              m_programName;
    types::String                              m_version;
    types::Vec<types::UniquePointer<Argument>> m_arguments;
    types::Map<types::String, Argument*>       m_argumentMap;
  };
} // namespace ccstatus::utils::argparse
