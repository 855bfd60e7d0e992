/**
 * @file ArgumentParser.hpp
 * @brief Small command-line parser used by the signrelay CLI.
 *
 * Supports flags, valued options, enum-backed options (via magic_enum) and
 * string choice lists, with a generated help screen.
 */

#pragma once

#include <algorithm>                 // std::ranges::{equal, transform}
#include <cctype>                    // std::tolower
#include <concepts>                  // std::convertible_to
#include <format>                    // std::format
#include <magic_enum/magic_enum.hpp> // magic_enum::{enum_name, enum_cast, enum_values, is_scoped_enum_v}
#include <variant>                   // std::{variant, get, holds_alternative}

#include "Error.hpp"
#include "Logging.hpp"
#include "Types.hpp"

namespace signrelay::utils::argparse {
  namespace {
    using error::RelayError;
    using error::RelayErrorCode;
    using logging::Println;

    using types::Err;
    using types::f64;
    using types::i32;
    using types::Map;
    using types::None;
    using types::Option;
    using types::Result;
    using types::Span;
    using types::String;
    using types::StringView;
    using types::UniquePointer;
    using types::Unit;
    using types::usize;
    using types::Vec;

    fn EqualsIgnoreCase(const StringView lhs, const StringView rhs) -> bool {
      return std::ranges::equal(lhs, rhs, [](const char charA, const char charB) {
        return std::tolower(static_cast<unsigned char>(charA)) == std::tolower(static_cast<unsigned char>(charB));
      });
    }

    fn ToLower(String text) -> String {
      std::ranges::transform(text, text.begin(), [](const char character) { return static_cast<char>(std::tolower(static_cast<unsigned char>(character))); });
      return text;
    }

    fn JoinLower(const Vec<String>& items) -> String {
      String joined;

      for (usize i = 0; i < items.size(); ++i) {
        if (i > 0)
          joined += ", ";

        joined += ToLower(items[i]);
      }

      return joined;
    }
  } // namespace

  using ArgValue   = std::variant<bool, i32, f64, String>;
  using ArgChoices = Vec<String>;

  /**
   * @brief String conversion for scoped enums, backed by magic_enum.
   * @tparam EnumType The enum type
   */
  template <typename EnumType>
  struct EnumTraits {
    static constexpr bool has_string_conversion = magic_enum::is_scoped_enum_v<EnumType>;

    static fn getChoices() -> ArgChoices {
      ArgChoices choices;

      for (const EnumType value : magic_enum::enum_values<EnumType>())
        choices.emplace_back(magic_enum::enum_name(value));

      return choices;
    }

    static fn stringToEnum(const StringView str) -> Option<EnumType> {
      for (const EnumType value : magic_enum::enum_values<EnumType>())
        if (EqualsIgnoreCase(str, magic_enum::enum_name(value)))
          return value;

      return None;
    }

    static fn enumToString(const EnumType value) -> String {
      return String(magic_enum::enum_name(value));
    }
  };

  /**
   * @brief One command-line argument: its aliases, help text, default and parsed value.
   */
  class Argument {
   public:
    template <typename... NameTs>
      requires(sizeof...(NameTs) >= 1 && (std::convertible_to<NameTs, String> && ...))
    explicit Argument(NameTs&&... names)
      : m_names { String(std::forward<NameTs>(names))... } {}

    fn help(String helpText) -> Argument& {
      m_helpText = std::move(helpText);
      return *this;
    }

    template <typename T>
      requires(!std::is_enum_v<T>)
    fn defaultValue(T value) -> Argument& {
      m_defaultValue = ArgValue(std::move(value));
      return *this;
    }

    /**
     * @brief Sets an enum default; the enum's names also become the allowed choices.
     */
    template <typename EnumType>
      requires std::is_enum_v<EnumType> && EnumTraits<EnumType>::has_string_conversion
    fn defaultValue(const EnumType value) -> Argument& {
      m_defaultValue = EnumTraits<EnumType>::enumToString(value);
      m_choices      = EnumTraits<EnumType>::getChoices();
      return *this;
    }

    fn flag() -> Argument& {
      m_isFlag       = true;
      m_defaultValue = false;
      return *this;
    }

    fn choices(ArgChoices choices) -> Argument& {
      m_choices = std::move(choices);
      return *this;
    }

    template <typename T>
    [[nodiscard]] fn get() const -> T {
      if (m_value && std::holds_alternative<T>(*m_value))
        return std::get<T>(*m_value);

      if (m_defaultValue && std::holds_alternative<T>(*m_defaultValue))
        return std::get<T>(*m_defaultValue);

      return T {};
    }

    template <typename EnumType>
      requires std::is_enum_v<EnumType> && EnumTraits<EnumType>::has_string_conversion
    [[nodiscard]] fn getEnum() const -> EnumType {
      return EnumTraits<EnumType>::stringToEnum(get<String>()).value_or(magic_enum::enum_values<EnumType>()[0]);
    }

    [[nodiscard]] fn isUsed() const -> bool {
      return m_isUsed;
    }

    [[nodiscard]] fn isFlag() const -> bool {
      return m_isFlag;
    }

    [[nodiscard]] fn getNames() const -> const Vec<String>& {
      return m_names;
    }

    [[nodiscard]] fn getHelpText() const -> const String& {
      return m_helpText;
    }

    [[nodiscard]] fn getChoices() const -> const Option<ArgChoices>& {
      return m_choices;
    }

    /**
     * @brief Stores a parsed value, rejecting strings outside the choice list.
     */
    fn setValue(String value) -> Result<> {
      if (m_choices && std::ranges::none_of(*m_choices, [&](const String& choice) { return EqualsIgnoreCase(value, choice); }))
        return Err(RelayError(
          RelayErrorCode::InvalidArgument,
          std::format("Invalid value '{}' for argument '{}'. Allowed values: {}", value, m_names.front(), JoinLower(*m_choices))
        ));

      m_value  = std::move(value);
      m_isUsed = true;
      return {};
    }

    fn markUsed() -> Unit {
      m_isUsed = true;

      if (m_isFlag)
        m_value = true;
    }

   private:
    Vec<String>        m_names;        ///< Aliases, e.g. {"-V", "--verbose"}
    String             m_helpText;     ///< Shown by --help
    Option<ArgValue>   m_value;        ///< Value given on the command line
    Option<ArgValue>   m_defaultValue; ///< Used when no value was given
    Option<ArgChoices> m_choices;      ///< Allowed values, if restricted
    bool               m_isFlag {};
    bool               m_isUsed {};
  };

  class ArgumentParser {
   public:
    explicit ArgumentParser(String version, String programName = "")
      : m_programName(std::move(programName)), m_version(std::move(version)) {}

    template <typename... NameTs>
      requires(sizeof...(NameTs) >= 1 && (std::convertible_to<NameTs, String> && ...))
    fn addArguments(NameTs&&... names) -> Argument& {
      Argument& arg = *m_arguments.emplace_back(std::make_unique<Argument>(std::forward<NameTs>(names)...));

      for (const String& name : arg.getNames())
        m_argumentMap[name] = &arg;

      return arg;
    }

    /**
     * @brief Parses argv. `--help` and `--version` are reported through the
     * returned flag so the caller decides how to exit.
     * @return true if the program should keep running, false if help or version was printed.
     */
    fn parseArgs(const Span<const char* const> args) -> Result<bool> {
      if (args.empty())
        return true;

      if (m_programName.empty())
        m_programName = args[0];

      for (usize i = 1; i < args.size(); ++i) {
        const StringView arg = args[i];

        if (arg == "-h" || arg == "--help") {
          printHelp();
          return false;
        }

        if (arg == "--version") {
          Println(m_version);
          return false;
        }

        const auto iter = m_argumentMap.find(arg);

        if (iter == m_argumentMap.end())
          return Err(RelayError(RelayErrorCode::InvalidArgument, std::format("Unknown argument: {}", arg)));

        Argument* argument = iter->second;

        if (argument->isFlag()) {
          argument->markUsed();
          continue;
        }

        if (i + 1 >= args.size())
          return Err(RelayError(RelayErrorCode::InvalidArgument, std::format("Argument {} requires a value", arg)));

        if (Result<> result = argument->setValue(String(args[++i])); !result)
          return Err(result.error());
      }

      return true;
    }

    template <typename T = String>
    [[nodiscard]] fn get(const StringView name) const -> T {
      const auto iter = m_argumentMap.find(name);
      return iter != m_argumentMap.end() ? iter->second->get<T>() : T {};
    }

    template <typename EnumType>
    [[nodiscard]] fn getEnum(const StringView name) const -> EnumType {
      const auto iter = m_argumentMap.find(name);
      return iter != m_argumentMap.end() ? iter->second->getEnum<EnumType>() : magic_enum::enum_values<EnumType>()[0];
    }

    [[nodiscard]] fn isUsed(const StringView name) const -> bool {
      const auto iter = m_argumentMap.find(name);
      return iter != m_argumentMap.end() && iter->second->isUsed();
    }

    fn printHelp() const -> Unit {
      String usage = std::format("Usage: {} [-h] [--version]", m_programName);

      for (const UniquePointer<Argument>& arg : m_arguments)
        usage += std::format(" [{}{}]", arg->getNames().front(), arg->isFlag() ? "" : " VALUE");

      Println(usage);
      Println();
      Println("Arguments:");

      for (const UniquePointer<Argument>& arg : m_arguments) {
        String names;

        for (const String& name : arg->getNames())
          names += names.empty() ? name : ", " + name;

        Println("  {}{}", names, arg->isFlag() ? "" : " VALUE");

        if (!arg->getHelpText().empty())
          Println("    {}", arg->getHelpText());

        if (arg->getChoices())
          Println("    Available values: {}", JoinLower(*arg->getChoices()));
      }
    }

   private:
    String                       m_programName;
    String                       m_version;
    Vec<UniquePointer<Argument>> m_arguments;
    Map<String, Argument*>       m_argumentMap;
  };
} // namespace signrelay::utils::argparse
