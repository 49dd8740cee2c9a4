DECLARE_MSG_ARG(actual, "2")
DECLARE_MSG_ARG(column, "7")
DECLARE_MSG_ARG(command_line, "pawnget acquire 3.10.10 ./pawnc")
DECLARE_MSG_ARG(command_name, "acquire")
DECLARE_MSG_ARG(env_var, "PAWNGET_CACHE_ROOT")
DECLARE_MSG_ARG(exit_code, "127")
DECLARE_MSG_ARG(expected, "1")
DECLARE_MSG_ARG(extraction, "tar+gzip")
DECLARE_MSG_ARG(member, "pawnc-3.10.10-linux/bin/pawncc")
DECLARE_MSG_ARG(option, "platform")
DECLARE_MSG_ARG(path, "/foo/bar")
DECLARE_MSG_ARG(placeholder, "release")
DECLARE_MSG_ARG(platform, "linux")
DECLARE_MSG_ARG(tool_name, "unzip")
DECLARE_MSG_ARG(url, "https://github.com/Zeex/pawn/releases/download/v3.10.10/pawnc-3.10.10-linux.tar.gz")
DECLARE_MSG_ARG(value, "")
DECLARE_MSG_ARG(version, "3.10.10")
