#include "GemLink/RuntimePaths.h"

#include <system_error>

namespace GemLink::RuntimePaths
{
	std::optional<std::filesystem::path> GetRuntimeDirectory()
	{
		std::error_code ec;
		std::filesystem::path path = std::filesystem::read_symlink("/proc/self/exe", ec);
		if (ec || path.empty()) {
			return std::nullopt;
		}

		path = path.remove_filename();
		return path;
	}

	std::filesystem::path ResolveRuntimeRelativePath(std::string_view a_relativePath)
	{
		const std::filesystem::path relative(a_relativePath);
		if (relative.is_absolute()) {
			return relative;
		}
		if (const auto runtimeDir = GetRuntimeDirectory(); runtimeDir) {
			return *runtimeDir / relative;
		}
		return std::filesystem::current_path() / relative;
	}
}
