DECLARE_MESSAGE(AcquireCommandSynopsis,
                (),
                "",
                "Downloads a pawnc release, caches it, and installs the compiler files into a directory")
DECLARE_MESSAGE(AcquireSucceeded, (msg::version, msg::path), "", "Installed pawnc {version} to {path}")
DECLARE_MESSAGE(AcquiringArtifact, (msg::version, msg::platform), "", "Acquiring pawnc {version} for {platform}")
DECLARE_MESSAGE(AcquisitionFailed,
                (msg::version, msg::platform),
                "",
                "failed to acquire pawnc {version} for {platform}")
DECLARE_MESSAGE(AcquisitionStageCache, (), "Names a step of acquisition, used as 'while {stage}:'", "reading the cache")
DECLARE_MESSAGE(AcquisitionStageExtraction,
                (),
                "Names a step of acquisition, used as 'while {stage}:'",
                "installing the compiler files")
DECLARE_MESSAGE(AcquisitionStageNetwork,
                (),
                "Names a step of acquisition, used as 'while {stage}:'",
                "downloading the compiler package")
DECLARE_MESSAGE(AcquisitionStageResolve,
                (),
                "Names a step of acquisition, used as 'while {stage}:'",
                "resolving the compiler package")
DECLARE_MESSAGE(AcquisitionWhileStage, (msg::value), "{value} is one of the AcquisitionStage messages", "while {value}:")
DECLARE_MESSAGE(ArchiveMemberLinksOutside,
                (msg::member, msg::path),
                "",
                "{member} in {path} is a link to a file outside the archive")
DECLARE_MESSAGE(ArchiveMemberMissing, (msg::member, msg::path), "", "{path} does not contain {member}")
DECLARE_MESSAGE(ArchiveToolFailed,
                (msg::tool_name, msg::path, msg::exit_code),
                "",
                "{tool_name} could not unpack {path} (exit code {exit_code}); the archive may be truncated or damaged")
DECLARE_MESSAGE(ArchiveToolLaunchFailed, (msg::tool_name, msg::path), "", "failed to run {tool_name} to unpack {path}")
DECLARE_MESSAGE(ArgumentRequiresValue, (msg::option), "", "the option --{option} requires a value")
DECLARE_MESSAGE(ArgumentTakesNoValue, (msg::option), "", "the option --{option} does not take a value")
DECLARE_MESSAGE(CacheCorruptEntry,
                (msg::path),
                "",
                "the cached package {path} is unusable and will be downloaded again")
DECLARE_MESSAGE(CacheEntryProbeFailed, (msg::path), "", "failed to inspect the cached package {path}")
DECLARE_MESSAGE(CachePathCommandSynopsis, (), "", "Prints the directory where downloaded packages are cached")
DECLARE_MESSAGE(CacheRootMustBeAbsolute,
                (msg::env_var, msg::path),
                "",
                "{env_var} must be an absolute path, but it was set to {path}")
DECLARE_MESSAGE(CacheStoreFailed, (msg::path), "", "failed to store {path} in the cache")
DECLARE_MESSAGE(CacheUnavailable, (), "", "no cache directory could be determined; pass --cache-root")
DECLARE_MESSAGE(ChecksFailedCheck, (), "", "pawnget has crashed; no additional details are available.")
DECLARE_MESSAGE(ChecksUnreachableCode, (), "", "unreachable code was reached")
DECLARE_MESSAGE(CommandRequiresArguments,
                (msg::command_name, msg::expected, msg::actual),
                "",
                "'{command_name}' requires {expected} arguments, but {actual} were provided")
DECLARE_MESSAGE(CurlDownloadTimeout, (), "", "the download timed out")
DECLARE_MESSAGE(CurlFailedGeneric, (msg::exit_code), "curl is the name of a program", "curl operation failed with error code {exit_code}.")
DECLARE_MESSAGE(CurlFailedHttpResponse,
                (msg::url, msg::exit_code),
                "",
                "{url}: the server responded with HTTP status {exit_code}")
DECLARE_MESSAGE(CurlShortWrite, (msg::path), "", "failed to write downloaded data to {path}")
DECLARE_MESSAGE(DownloadCancelled, (msg::url), "", "the download of {url} was cancelled")
DECLARE_MESSAGE(DownloadFailed, (msg::url), "", "failed to download {url}")
DECLARE_MESSAGE(DownloadingArtifact, (msg::url), "", "Downloading {url}")
DECLARE_MESSAGE(ExtractingArtifact, (msg::path), "", "Extracting {path}")
DECLARE_MESSAGE(ExtractionFailed, (msg::path), "", "failed to extract {path}")
DECLARE_MESSAGE(ExtractionWriteFailed, (msg::member, msg::path), "", "failed to install {member} to {path}")
DECLARE_MESSAGE(HelpCommandSynopsis, (), "", "Displays help for pawnget or for one of its commands")
DECLARE_MESSAGE(HelpCommandsHeader, (), "", "Commands:")
DECLARE_MESSAGE(HelpExampleHeader, (), "", "Example:")
DECLARE_MESSAGE(HelpGlobalOptionsHeader, (), "", "Options:")
DECLARE_MESSAGE(HelpOptionCacheRoot,
                (msg::env_var),
                "",
                "Directory used to cache downloaded packages (default: {env_var} or the user cache directory)")
DECLARE_MESSAGE(HelpOptionDebug, (), "", "Prints internal diagnostic output")
DECLARE_MESSAGE(HelpOptionPlatform, (), "", "Platform to acquire for: darwin, linux or windows (default: host)")
DECLARE_MESSAGE(HelpOptionTimeout,
                (msg::env_var),
                "",
                "Abandons a download after this many seconds (default: {env_var}, or no limit)")
DECLARE_MESSAGE(HelpUsage, (), "", "usage: pawnget <command> [--options]")
DECLARE_MESSAGE(HostPlatformUnsupported, (), "", "this host is not a supported platform; pass --platform")
DECLARE_MESSAGE(InvalidCommand, (msg::command_name), "", "invalid command: {command_name}")
DECLARE_MESSAGE(InvalidDownloadUrl,
                (msg::url),
                "",
                "'{url}' is not a valid download URL; it needs a scheme, a host, and a file name")
DECLARE_MESSAGE(InvalidInstallPath,
                (msg::path),
                "",
                "'{path}' is not a valid relative path; it must not be empty, absolute, or contain '.' or '..'")
DECLARE_MESSAGE(InvalidOption, (msg::option, msg::command_name), "", "'--{option}' is not an option of '{command_name}'")
DECLARE_MESSAGE(InvalidTimeout, (msg::value), "", "'{value}' is not a valid number of seconds")
DECLARE_MESSAGE(InvalidVersion,
                (msg::version),
                "",
                "'{version}' is not a valid version; versions may only contain letters, digits, '.', '_', '+' and '-'")
DECLARE_MESSAGE(OperationCancelled, (), "", "the operation was cancelled")
DECLARE_MESSAGE(PawngetHasCrashed, (), "", "pawnget has crashed.")
DECLARE_MESSAGE(ResolveCommandSynopsis,
                (),
                "",
                "Prints where a pawnc release is downloaded from and which files are installed from it")
DECLARE_MESSAGE(ResolvedCacheFile, (msg::path), "", "Cache file: {path}")
DECLARE_MESSAGE(ResolvedExtraction, (msg::extraction), "", "Format: {extraction}")
DECLARE_MESSAGE(ResolvedMember, (msg::member, msg::path), "", "{member} -> {path}")
DECLARE_MESSAGE(ResolvedMembersHeader, (), "", "Installed files:")
DECLARE_MESSAGE(ResolvedUrl, (msg::url), "", "URL: {url}")
DECLARE_MESSAGE(TemplateUnbalancedBrace,
                (msg::value, msg::column),
                "{value} is a URL or path template",
                "unbalanced brace in template '{value}' at column {column}")
DECLARE_MESSAGE(TemplateUnknownPlaceholder,
                (msg::value, msg::placeholder, msg::column),
                "{value} is a URL or path template. {{version}} must not be localized.",
                "unknown placeholder '{placeholder}' in template '{value}' at column {column}; only {{version}} is "
                "supported")
DECLARE_MESSAGE(UnableToReadEnvironmentVariable, (msg::env_var), "", "unable to read {env_var}")
DECLARE_MESSAGE(UnsupportedPlatform,
                (msg::platform, msg::value),
                "{value} is a comma separated list of platform names",
                "unsupported platform '{platform}'; supported platforms are: {value}")
DECLARE_MESSAGE(UsingCachedArtifact, (msg::path), "", "Using cached package {path}")
DECLARE_MESSAGE(VersionCommandHeader, (msg::version), "", "pawnget package acquisition tool version {version}")
DECLARE_MESSAGE(VersionCommandSynopsis, (), "", "Displays version information")
