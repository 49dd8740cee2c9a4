#include <pawnget/base/checks.h>
#include <pawnget/base/strings.h>
#include <pawnget/base/system.h>

#include <pawnget/pawngetcmdarguments.h>

#include <algorithm>

namespace
{
    using namespace pawnget;

    void set_once(Optional<std::string>& target, StringLiteral option, const Optional<std::string>& value,
                  std::vector<LocalizedString>& errors)
    {
        if (auto v = value.get())
        {
            target = *v;
        }
        else
        {
            errors.push_back(msg::format(msgArgumentRequiresValue, msg::option = option));
        }
    }

    std::string format_arity(const CommandMetadata& command_metadata)
    {
        if (command_metadata.minimum_arity == command_metadata.maximum_arity)
        {
            return std::to_string(command_metadata.minimum_arity);
        }

        return fmt::format("{} to {}", command_metadata.minimum_arity, command_metadata.maximum_arity);
    }
}

namespace pawnget
{
    const std::string* ParsedArguments::read_setting(StringLiteral setting) const noexcept
    {
        auto it = settings.find(setting);
        if (it == settings.end())
        {
            return nullptr;
        }

        return &it->second;
    }

    const CommandSetting* CommandMetadata::find_setting(StringView setting_name) const noexcept
    {
        for (size_t idx = 0; idx < settings_size; ++idx)
        {
            if (settings[idx].name == setting_name)
            {
                return &settings[idx];
            }
        }

        return nullptr;
    }

    LocalizedString usage_for_command(const CommandMetadata& command_metadata)
    {
        LocalizedString result;
        result.append(*command_metadata.synopsis).append_raw('\n');
        result.append(msgHelpExampleHeader).append_raw('\n').append_indent().append_raw(command_metadata.example);
        if (command_metadata.settings_size != 0)
        {
            result.append_raw('\n').append(msgHelpGlobalOptionsHeader);
            for (size_t idx = 0; idx < command_metadata.settings_size; ++idx)
            {
                const auto& setting = command_metadata.settings[idx];
                result.append_raw('\n')
                    .append_indent()
                    .append_raw(fmt::format("{:<24}", fmt::format("--{}=...", setting.name)))
                    .append(*setting.helpmsg);
            }
        }

        return result;
    }

    PawnGetCmdArguments PawnGetCmdArguments::create_from_command_line(const int argc, const char* const* const argv)
    {
        std::vector<std::string> v;
        for (int i = 1; i < argc; ++i)
        {
            v.emplace_back(argv[i]);
        }

        return PawnGetCmdArguments::create_from_arg_sequence(v.data(), v.data() + v.size());
    }

    PawnGetCmdArguments PawnGetCmdArguments::create_from_arg_sequence(const std::string* arg_begin,
                                                                       const std::string* arg_end)
    {
        PawnGetCmdArguments args;
        bool options_ended = false;
        for (auto it = arg_begin; it != arg_end; ++it)
        {
            const StringView arg = *it;
            if (!options_ended && arg.starts_with("--"))
            {
                if (arg.size() == 2)
                {
                    options_ended = true;
                    continue;
                }

                const auto name_value = arg.substr(2);
                const auto eq = std::find(name_value.begin(), name_value.end(), '=');
                const auto name = Strings::ascii_to_lowercase(StringView{name_value.begin(), eq});
                Optional<std::string> value;
                if (eq != name_value.end())
                {
                    value.emplace(eq + 1, name_value.end());
                }

                if (name == SwitchDebug)
                {
                    if (value.has_value())
                    {
                        args.errors.push_back(msg::format(msgArgumentTakesNoValue, msg::option = SwitchDebug));
                    }
                    else
                    {
                        args.debug = true;
                    }
                }
                else if (name == SwitchCacheRoot)
                {
                    set_once(args.cache_root_dir, SwitchCacheRoot, value, args.errors);
                }
                else if (name == SwitchTimeout)
                {
                    set_once(args.download_timeout_seconds, SwitchTimeout, value, args.errors);
                }
                else
                {
                    args.command_options.emplace_back(name, std::move(value));
                }

                continue;
            }

            if (args.command.empty())
            {
                args.command = *it;
            }
            else
            {
                args.positional_arguments.push_back(*it);
            }
        }

        return args;
    }

    void PawnGetCmdArguments::imbue_from_environment()
    {
        if (!debug.has_value())
        {
            auto maybe_debug = get_environment_variable(EnvironmentVariablePawngetDebug);
            if (auto debug_value = maybe_debug.get())
            {
                if (*debug_value == "1")
                {
                    debug = true;
                }
            }
        }

        if (!download_timeout_seconds.has_value())
        {
            auto maybe_timeout = get_environment_variable(EnvironmentVariablePawngetDownloadTimeout);
            if (auto timeout_value = maybe_timeout.get())
            {
                if (!timeout_value->empty())
                {
                    download_timeout_seconds = std::move(*timeout_value);
                }
            }
        }
    }

    ExpectedL<ParsedArguments> PawnGetCmdArguments::try_parse_arguments(const CommandMetadata& command_metadata) const
    {
        ParsedArguments result;
        for (auto&& option : command_options)
        {
            const auto setting = command_metadata.find_setting(option.first);
            if (!setting)
            {
                return msg::format(
                    msgInvalidOption, msg::option = option.first, msg::command_name = command_metadata.name);
            }

            auto value = option.second.get();
            if (!value)
            {
                return msg::format(msgArgumentRequiresValue, msg::option = option.first);
            }

            result.settings.insert_or_assign(setting->name, *value);
        }

        const auto actual = positional_arguments.size();
        if (actual < command_metadata.minimum_arity || actual > command_metadata.maximum_arity)
        {
            return msg::format(msgCommandRequiresArguments,
                               msg::command_name = command_metadata.name,
                               msg::expected = format_arity(command_metadata),
                               msg::actual = actual);
        }

        result.command_arguments = positional_arguments;
        return result;
    }

    ParsedArguments PawnGetCmdArguments::parse_arguments(const CommandMetadata& command_metadata) const
    {
        auto maybe_parsed = try_parse_arguments(command_metadata);
        if (auto parsed = maybe_parsed.get())
        {
            return std::move(*parsed);
        }

        msg::println_error(maybe_parsed.error());
        msg::write_unlocalized_text_to_stderr(Color::none, usage_for_command(command_metadata).append_raw('\n'));
        Checks::exit_fail(PAWNGET_LINE_INFO);
    }

    ExpectedL<Optional<std::chrono::seconds>> PawnGetCmdArguments::download_timeout() const
    {
        auto value = download_timeout_seconds.get();
        if (!value)
        {
            return Optional<std::chrono::seconds>{};
        }

        auto maybe_seconds = Strings::strto_unsigned(*value);
        auto seconds = maybe_seconds.get();
        if (!seconds || *seconds > static_cast<unsigned long long>(std::chrono::seconds::max().count()))
        {
            return msg::format(msgInvalidTimeout, msg::value = *value);
        }

        if (*seconds == 0)
        {
            return Optional<std::chrono::seconds>{};
        }

        return Optional<std::chrono::seconds>{std::chrono::seconds{static_cast<std::chrono::seconds::rep>(*seconds)}};
    }
}
