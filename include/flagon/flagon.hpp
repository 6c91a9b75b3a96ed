#ifndef FLAGON_HPP
#define FLAGON_HPP

#pragma once

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <expected>
#include <format>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

// Flagon follows semantic versioning (https://semver.org/). The minor
// version is bumped whenever the public API changes until v1.0.0.

#define FLAGON_VERSION_MAJOR 0
#define FLAGON_VERSION_MINOR 1
#define FLAGON_VERSION_PATCH 0

#define FLAGON_CONCAT_V_(mj, mi, pa) v_##mj##_##mi##_##pa
#define FLAGON_CONCAT_V(mj, mi, pa) FLAGON_CONCAT_V_(mj, mi, pa)

// using c++20 inline nested namespace extension.
#define FLAGON_SET_NAMESPACE                                                   \
  namespace flagon::inline FLAGON_CONCAT_V(                                    \
    FLAGON_VERSION_MAJOR, FLAGON_VERSION_MINOR, FLAGON_VERSION_PATCH)

// debug trace, compiled in with -DFLAGON_DEBUG
#if defined(FLAGON_DEBUG)
#define FLAGON_D_PRINT(x) std::cerr << "[flagon] " << x << "\n";
#else
#define FLAGON_D_PRINT(x)
#endif // defined(FLAGON_DEBUG)

FLAGON_SET_NAMESPACE
{
  inline constexpr std::string_view SHORT_PREFIX = "-";
  inline constexpr std::string_view LONG_PREFIX = "--";

  enum class error_code
  {
    none,

    // declaration errors

    empty_identifier, // a flag was declared without a short or long id
    duplicate_flag,   // a short or long id is already taken

    // parse errors

    missing_value, // a typed flag was the last token
    invalid_value, // a typed flag's argument could not be converted
    invalid_flag,  // unknown flag token and the policy rejects it

    // evaluation errors

    missing_input,  // nothing positional left to hand to the handler
    missing_handler // the command was built without a handler
  };

  enum class error_type
  {
    none,
    declaration_error,
    parse_error,
    evaluation_error
  };

  struct error
  {
    error_type type{ error_type::none };
    error_code code{ error_code::none };
    std::string message;
  };

  enum class value_kind : uint8_t
  {
    boolean,
    text,
    integer,
    floating_point
  };

  constexpr std::string_view value_kind_to_string(const value_kind vk)
  {
    using namespace std::string_view_literals;
    switch(vk)
    {
      case value_kind::boolean:
        return "boolean"sv;
      case value_kind::text:
        return "text"sv;
      case value_kind::integer:
        return "integer"sv;
      case value_kind::floating_point:
        return "float"sv;
    }
    return "unknown";
  }

  namespace detail
  {
    inline std::vector<std::string> collect_args(int argc, char** argv)
    {
      std::vector<std::string> args;
      args.reserve(argc > 0 ? static_cast<size_t>(argc) : 0);
      for(auto i = 0; i < argc; i++)
      {
        args.emplace_back(argv[i] != nullptr ? argv[i] : "");
      }
      return args;
    }

    inline error make_empty_identifier(const std::string& description)
    {
      return { error_type::declaration_error, error_code::empty_identifier,
               std::format("Flag '{}' has an empty short or long identifier",
                           description) };
    }

    inline error make_duplicate_flag(std::string_view prefix,
                                     const std::string& id)
    {
      return { error_type::declaration_error, error_code::duplicate_flag,
               std::format("Flag identifier '{}{}' is already declared",
                           prefix, id) };
    }

    inline error make_missing_value(const std::string& token)
    {
      return { error_type::parse_error, error_code::missing_value,
               std::format("Flag '{}' requires a value, but none was provided",
                           token) };
    }

    inline error make_invalid_value(const std::string& token,
                                    const std::string& raw, value_kind kind)
    {
      return { error_type::parse_error, error_code::invalid_value,
               std::format("Invalid {} value '{}' for flag '{}'",
                           value_kind_to_string(kind), raw, token) };
    }

    inline error make_invalid_flag(const std::string& token)
    {
      return { error_type::parse_error, error_code::invalid_flag,
               std::format("Unknown flag '{}'", token) };
    }

    inline error make_missing_input(const std::string& program)
    {
      return { error_type::evaluation_error, error_code::missing_input,
               std::format("Missing input, see '{} {}help'", program,
                           LONG_PREFIX) };
    }

    inline error make_missing_handler(const std::string& program)
    {
      return { error_type::evaluation_error, error_code::missing_handler,
               std::format("Command '{}' has no handler to run", program) };
    }
  } // namespace detail

  enum class conversion_error
  {
    cant_convert_type
  };

  // base converter, the whole token has to be consumed
  template <typename T>
  requires std::is_default_constructible_v<T>
  struct converter
  {
    static std::expected<T, conversion_error> convert(const std::string& input)
    {
      T result{};
      std::stringstream ss(input);
      ss >> std::noskipws;
      if(!(ss >> result) || !ss.eof())
      {
        return std::unexpected(conversion_error::cant_convert_type);
      }
      return result;
    }
  };

  template <>
  struct converter<bool>
  {
    static std::expected<bool, conversion_error>
    convert(const std::string& input)
    {
      std::string lower = input;
      std::transform(lower.begin(), lower.end(), lower.begin(),
                     [](unsigned char c) { return std::tolower(c); });
      if(lower == "true" || lower == "1" || lower == "yes" || lower == "y")
        return true;
      if(lower == "false" || lower == "0" || lower == "no" || lower == "n")
        return false;
      return std::unexpected(conversion_error::cant_convert_type);
    }
  };

  // text is taken verbatim, spaces included
  template <>
  struct converter<std::string>
  {
    static std::expected<std::string, conversion_error>
    convert(const std::string& input)
    {
      return input;
    }
  };

  enum class value_state
  {
    present,   // provided in input
    defaulted, // declared default
    missing    // no input and no default
  };

  enum class access_error
  {
    wrong_kind,
    no_value,
    not_found
  };

  // typed payload of a flag. the kind is chosen by the factory and never
  // changes, only the payload does.
  class flag_value
  {
  public:
    using payload_type = std::variant<bool, std::string, int32_t, float>;

  public:
    flag_value() : flag_value(payload_type{ false }, true) {}

    static flag_value boolean(bool default_value = false)
    {
      return flag_value{ payload_type{ default_value }, true };
    }

    static flag_value text(std::optional<std::string> default_value = {})
    {
      return make_typed<std::string>(std::move(default_value));
    }

    static flag_value integer(std::optional<int32_t> default_value = {})
    {
      return make_typed<int32_t>(default_value);
    }

    static flag_value floating_point(std::optional<float> default_value = {})
    {
      return make_typed<float>(default_value);
    }

    value_kind kind() const
    {
      return static_cast<value_kind>(m_payload.index());
    }

    value_state state() const
    {
      return m_state;
    }

    bool has_value() const
    {
      return m_state != value_state::missing;
    }

    // T must be one of the payload alternatives
    template <typename T>
    std::expected<T, access_error> get() const
    {
      const auto* current = std::get_if<T>(&m_payload);
      if(current == nullptr)
        return std::unexpected(access_error::wrong_kind);
      if(m_state == value_state::missing)
        return std::unexpected(access_error::no_value);
      return *current;
    }

    // presence of a boolean flag, other kinds are left alone
    bool set_true()
    {
      auto* b = std::get_if<bool>(&m_payload);
      if(b == nullptr)
        return false;
      *b = true;
      m_state = value_state::present;
      return true;
    }

    // converts raw into the declared kind, untouched on failure
    std::expected<void, conversion_error> assign(const std::string& raw)
    {
      return std::visit(
        [&](auto& current) -> std::expected<void, conversion_error>
        {
          using T = std::decay_t<decltype(current)>;
          auto converted = converter<T>::convert(raw);
          if(!converted)
            return std::unexpected(converted.error());
          current = std::move(*converted);
          m_state = value_state::present;
          return {};
        },
        m_payload);
    }

    void reset()
    {
      m_payload = m_initial;
      m_state = m_has_default ? value_state::defaulted : value_state::missing;
    }

    std::string to_string() const
    {
      if(m_state == value_state::missing)
        return "";
      return std::visit(
        [](const auto& current) -> std::string
        {
          using T = std::decay_t<decltype(current)>;
          if constexpr(std::is_same_v<T, bool>)
            return current ? "true" : "false";
          else if constexpr(std::is_same_v<T, std::string>)
            return current;
          else
            return std::format("{}", current);
        },
        m_payload);
    }

  private:
    flag_value(payload_type initial, bool has_default)
      : m_payload(initial), m_initial(std::move(initial)),
        m_has_default(has_default),
        m_state(has_default ? value_state::defaulted : value_state::missing)
    {
    }

    template <typename T>
    static flag_value make_typed(std::optional<T> default_value)
    {
      if(default_value)
        return flag_value{ payload_type{ std::in_place_type<T>,
                                         std::move(*default_value) },
                           true };
      return flag_value{ payload_type{ std::in_place_type<T> }, false };
    }

  private:
    payload_type m_payload;
    payload_type m_initial;
    bool m_has_default{ false };
    value_state m_state{ value_state::missing };
  };

  struct flag_spec
  {
    std::string short_id;    // e.g. f
    std::string long_id;     // e.g. ferris
    std::string description; // e.g. say hello from ferris
    flag_value value;

    // help line: "  -f, --ferris<tab>say hello from ferris"
    std::string to_string() const
    {
      return std::format("  {}{}, {}{}\t{}", SHORT_PREFIX, short_id,
                         LONG_PREFIX, long_id, description);
    }
  };

  inline flag_spec make_bool(std::string short_id, std::string long_id,
                             std::string description)
  {
    return { std::move(short_id), std::move(long_id), std::move(description),
             flag_value::boolean() };
  }

  inline flag_spec make_text(std::string short_id, std::string long_id,
                             std::string description,
                             std::optional<std::string> default_value = {})
  {
    return { std::move(short_id), std::move(long_id), std::move(description),
             flag_value::text(std::move(default_value)) };
  }

  inline flag_spec make_int(std::string short_id, std::string long_id,
                            std::string description,
                            std::optional<int32_t> default_value = {})
  {
    return { std::move(short_id), std::move(long_id), std::move(description),
             flag_value::integer(default_value) };
  }

  inline flag_spec make_float(std::string short_id, std::string long_id,
                              std::string description,
                              std::optional<float> default_value = {})
  {
    return { std::move(short_id), std::move(long_id), std::move(description),
             flag_value::floating_point(default_value) };
  }

  // "--" also starts with "-"
  inline bool is_flag_token(std::string_view token)
  {
    return token.starts_with(SHORT_PREFIX) || token.starts_with(LONG_PREFIX);
  }

  // exact, case sensitive. no prefix matching, no "=value" splitting
  inline bool matches(const flag_spec& flag, std::string_view token)
  {
    if(token.starts_with(LONG_PREFIX) &&
       token.substr(LONG_PREFIX.size()) == flag.long_id)
    {
      return true;
    }
    return token.starts_with(SHORT_PREFIX) &&
           token.substr(SHORT_PREFIX.size()) == flag.short_id;
  }

  struct partition_result
  {
    std::vector<std::string> positional;   // order preserved
    std::vector<std::string> unrecognized; // flag tokens nobody declared
  };

  // single pass over tokens, which are never modified. matching flags are
  // updated in place: booleans become true, typed flags take the next token
  // as their argument.
  inline std::expected<partition_result, error>
  partition(std::vector<flag_spec>& flags,
            const std::vector<std::string>& tokens)
  {
    partition_result res;
    for(size_t i = 0; i < tokens.size(); ++i)
    {
      const auto& token = tokens[i];
      if(!is_flag_token(token))
      {
        res.positional.push_back(token);
        continue;
      }

      bool matched = false;
      bool consumed_next = false;
      for(auto& flag : flags)
      {
        if(!matches(flag, token))
          continue;

        matched = true;
        if(flag.value.set_true())
        {
          FLAGON_D_PRINT("partition: '" << token << "' set");
          continue;
        }

        if(i + 1 >= tokens.size())
          return std::unexpected(detail::make_missing_value(token));

        const auto& raw = tokens[i + 1];
        if(!flag.value.assign(raw))
          return std::unexpected(
            detail::make_invalid_value(token, raw, flag.value.kind()));

        FLAGON_D_PRINT("partition: '" << token << "' = '" << raw << "'");
        consumed_next = true;
      }

      if(!matched)
      {
        FLAGON_D_PRINT("partition: unknown flag '" << token << "'");
        res.unrecognized.push_back(token);
      }
      if(consumed_next)
        ++i;
    }
    return res;
  }

  struct program_info
  {
    std::string name;    // e.g. hello
    std::string version; // e.g. 0.1.0
  };

  enum class unknown_flag_policy
  {
    ignore, // drop the token silently
    warn,   // drop the token and write a warning line
    reject  // stop with error_code::invalid_flag
  };

  enum class execution_result
  {
    help_shown,
    version_shown,
    handler_invoked
  };

  class command;

  class help_renderer
  {
  public:
    virtual ~help_renderer() = default;
    virtual std::string render(const command& cmd) const = 0;
  };

  class version_renderer
  {
  public:
    virtual ~version_renderer() = default;
    virtual std::string render(const command& cmd) const = 0;
  };

  // description, usage and one line per flag in declaration order
  class default_help_renderer final : public help_renderer
  {
  public:
    std::string render(const command& cmd) const override;
  };

  // "{name} version {version}"
  class default_version_renderer final : public version_renderer
  {
  public:
    std::string render(const command& cmd) const override;
  };

  class command
  {
  public:
    using flag_list = std::vector<std::reference_wrapper<const flag_spec>>;
    using handler_type =
      std::function<void(std::optional<std::string> input, const flag_list& flags)>;
    using line_writer = std::function<void(std::string_view line)>;

    static constexpr std::string_view HELP_SHORT = "h";
    static constexpr std::string_view HELP_LONG = "help";
    static constexpr std::string_view VERSION_SHORT = "v";
    static constexpr std::string_view VERSION_LONG = "version";

  public:
    command(program_info info, std::string description, std::string usage,
            handler_type handler)
      : m_info(std::move(info)), m_description(std::move(description)),
        m_usage(std::move(usage)), m_handler(std::move(handler)),
        m_help_renderer(std::make_unique<default_help_renderer>()),
        m_version_renderer(std::make_unique<default_version_renderer>())
    {
      // reserved flags, always first and in this order
      m_flags.push_back(make_bool(std::string(HELP_SHORT),
                                  std::string(HELP_LONG),
                                  std::format("help for {}", m_info.name)));
      m_flags.push_back(make_bool(std::string(VERSION_SHORT),
                                  std::string(VERSION_LONG),
                                  std::format("version for {}", m_info.name)));
    }

    // build stage (pre execute)

    std::expected<void, error> add_flag(flag_spec flag)
    {
      if(flag.short_id.empty() || flag.long_id.empty())
        return std::unexpected(detail::make_empty_identifier(flag.description));

      for(const auto& existing : m_flags)
      {
        if(existing.short_id == flag.short_id)
          return std::unexpected(
            detail::make_duplicate_flag(SHORT_PREFIX, flag.short_id));
        if(existing.long_id == flag.long_id)
          return std::unexpected(
            detail::make_duplicate_flag(LONG_PREFIX, flag.long_id));
      }

      m_flags.push_back(std::move(flag));
      return {};
    }

    void set_help_renderer(std::unique_ptr<help_renderer> renderer)
    {
      if(renderer)
        m_help_renderer = std::move(renderer);
    }

    void set_version_renderer(std::unique_ptr<version_renderer> renderer)
    {
      if(renderer)
        m_version_renderer = std::move(renderer);
    }

    void set_unknown_flag_policy(unknown_flag_policy policy)
    {
      m_unknown_flag_policy = policy;
    }

    void set_output(line_writer writer)
    {
      m_out = std::move(writer);
    }

    void set_error_output(line_writer writer)
    {
      m_err = std::move(writer);
    }

    // accessors

    const program_info& info() const
    {
      return m_info;
    }

    const std::string& description() const
    {
      return m_description;
    }

    const std::string& usage() const
    {
      return m_usage;
    }

    const std::vector<flag_spec>& get_all_flags() const
    {
      return m_flags;
    }

    // user flags only, help and version are left out
    flag_list get_flags() const
    {
      flag_list flags;
      for(size_t i = RESERVED_FLAG_COUNT; i < m_flags.size(); ++i)
        flags.push_back(std::cref(m_flags[i]));
      return flags;
    }

    // by short or long id
    std::expected<std::reference_wrapper<const flag_spec>, access_error>
    get_flag(std::string_view id) const
    {
      for(const auto& flag : m_flags)
      {
        if(flag.short_id == id || flag.long_id == id)
          return std::cref(flag);
      }
      return std::unexpected(access_error::not_found);
    }

    // execution

    std::expected<execution_result, error> execute(int argc, char** argv)
    {
      return execute(detail::collect_args(argc, argv));
    }

    // args[0] is the program path and never takes part in matching
    std::expected<execution_result, error>
    execute(const std::vector<std::string>& args)
    {
      for(auto& flag : m_flags)
        flag.value.reset();

      std::vector<std::string> tokens;
      if(args.size() <= 1)
        tokens.push_back(std::format("{}{}", LONG_PREFIX, HELP_LONG));
      else
        tokens.assign(args.begin() + 1, args.end());

      FLAGON_D_PRINT("execute: " << tokens.size() << " token(s)");

      auto parted = partition(m_flags, tokens);
      if(!parted)
        return std::unexpected(parted.error());

      for(const auto& token : parted->unrecognized)
      {
        switch(m_unknown_flag_policy)
        {
          case unknown_flag_policy::ignore:
            break;
          case unknown_flag_policy::warn:
            m_err(std::format("warning: unknown flag '{}'", token));
            break;
          case unknown_flag_policy::reject:
            return std::unexpected(detail::make_invalid_flag(token));
        }
      }

      // help wins over version
      if(is_set(HELP_INDEX))
      {
        write_lines(m_help_renderer->render(*this));
        return execution_result::help_shown;
      }
      if(is_set(VERSION_INDEX))
      {
        // single write, whatever the renderer returns
        m_out(m_version_renderer->render(*this));
        return execution_result::version_shown;
      }

      if(parted->positional.empty())
        return std::unexpected(detail::make_missing_input(m_info.name));

      FLAGON_D_PRINT("execute: dispatching '" << parted->positional.front()
                                              << "'");
      if(!m_handler)
        return std::unexpected(detail::make_missing_handler(m_info.name));

      m_handler(parted->positional.front(), get_flags());
      return execution_result::handler_invoked;
    }

    // process entry helper, returns the exit code
    int run(int argc, char** argv)
    {
      auto res = execute(argc, argv);
      if(!res)
      {
        m_err(std::format("error: {}", res.error().message));
        return 1;
      }
      return 0;
    }

  private:
    static constexpr size_t HELP_INDEX = 0;
    static constexpr size_t VERSION_INDEX = 1;
    static constexpr size_t RESERVED_FLAG_COUNT = 2;

    bool is_set(size_t index) const
    {
      return m_flags[index].value.get<bool>().value_or(false);
    }

    // one call per line, a trailing newline does not produce an empty line
    void write_lines(std::string_view text) const
    {
      while(!text.empty())
      {
        const auto end = text.find('\n');
        m_out(text.substr(0, end));
        if(end == std::string_view::npos)
          break;
        text.remove_prefix(end + 1);
      }
    }

  private:
    program_info m_info;
    std::string m_description;
    std::string m_usage;
    std::vector<flag_spec> m_flags;
    handler_type m_handler;
    std::unique_ptr<help_renderer> m_help_renderer;
    std::unique_ptr<version_renderer> m_version_renderer;
    unknown_flag_policy m_unknown_flag_policy{ unknown_flag_policy::ignore };
    line_writer m_out{ [](std::string_view line) { std::cout << line << "\n"; } };
    line_writer m_err{ [](std::string_view line) { std::cerr << line << "\n"; } };
  };

  inline std::string default_help_renderer::render(const command& cmd) const
  {
    std::string text;
    text += std::format("{}\n", cmd.description());
    text += "\n";
    text += "Usage:\n";
    text += std::format("  {}\n", cmd.usage());
    text += "\n";
    text += "Flags:\n";
    for(const auto& flag : cmd.get_all_flags())
      text += std::format("{}\n", flag.to_string());
    return text;
  }

  inline std::string default_version_renderer::render(const command& cmd) const
  {
    return std::format("{} version {}", cmd.info().name, cmd.info().version);
  }
} // namespace flagon::inline v_0_1_0

#endif // FLAGON_HPP
