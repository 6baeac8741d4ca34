// CRPF001A.cpp - Platform Path Resolution
// Component ID: CRPF001A (Platform/Paths)

#include "CRPF001A.h"

#include <cstdlib>
#include <system_error>

#if defined(_WIN32)
    #include <windows.h>
#elif defined(__linux__)
    #include <unistd.h>
    #include <linux/limits.h>
#elif defined(__APPLE__)
    #include <mach-o/dyld.h>
    #include <limits.h>
#endif

namespace Umbra::Platform {

fs::path PathResolver::executableDirectory() {
    static const fs::path directory = []() {
        fs::path result;
        #if defined(_WIN32)
            wchar_t path[MAX_PATH];
            DWORD len = GetModuleFileNameW(NULL, path, MAX_PATH);
            if (len > 0 && len < MAX_PATH) {
                result = fs::path(path).parent_path();
            }
        #elif defined(__linux__)
            char path[PATH_MAX];
            ssize_t len = readlink("/proc/self/exe", path, sizeof(path) - 1);
            if (len != -1) {
                path[len] = '\0';
                result = fs::path(path).parent_path();
            }
        #elif defined(__APPLE__)
            char path[PATH_MAX];
            uint32_t size = sizeof(path);
            if (_NSGetExecutablePath(path, &size) == 0) {
                std::error_code ec;
                result = fs::canonical(fs::path(path), ec).parent_path();
            }
        #endif
        return result;
    }();
    return directory;
}

fs::path PathResolver::userConfigDirectory() {
    #if defined(_WIN32)
        const char* appdata = std::getenv("APPDATA");
        if (appdata) {
            return fs::path(appdata) / "Umbra";
        }
    #elif defined(__APPLE__)
        const char* home = std::getenv("HOME");
        if (home) {
            return fs::path(home) / "Library" / "Application Support" / "Umbra";
        }
    #else
        const char* xdgConfig = std::getenv("XDG_CONFIG_HOME");
        if (xdgConfig && xdgConfig[0] != '\0') {
            return fs::path(xdgConfig) / "umbra";
        }
        const char* home = std::getenv("HOME");
        if (home) {
            return fs::path(home) / ".config" / "umbra";
        }
    #endif
    return fs::path();
}

fs::path PathResolver::systemConfigDirectory() {
    #if defined(_WIN32)
        const char* programData = std::getenv("PROGRAMDATA");
        if (programData) {
            return fs::path(programData) / "Umbra";
        }
        return fs::path("C:/ProgramData/Umbra");
    #else
        return fs::path("/etc/umbra");
    #endif
}

std::vector<fs::path> PathResolver::configSearchPaths() {
    std::vector<fs::path> paths;

    std::error_code ec;
    const fs::path cwd = fs::current_path(ec);
    if (!ec) {
        paths.push_back(cwd / CONFIG_FILE_NAME);
    }

    const fs::path exeDir = executableDirectory();
    if (!exeDir.empty()) {
        paths.push_back(exeDir / CONFIG_FILE_NAME);
    }

    const fs::path userConfig = userConfigDirectory();
    if (!userConfig.empty()) {
        paths.push_back(userConfig / CONFIG_FILE_NAME);
    }

    paths.push_back(systemConfigDirectory() / CONFIG_FILE_NAME);

    return paths;
}

std::optional<fs::path> PathResolver::findConfigFile() {
    for (const auto& path : configSearchPaths()) {
        std::error_code ec;
        if (fs::is_regular_file(path, ec)) {
            return path;
        }
    }
    return std::nullopt;
}

std::string PathResolver::platformName() {
    #if defined(_WIN32)
        return "Windows";
    #elif defined(__APPLE__)
        return "macOS";
    #else
        return "Linux";
    #endif
}

} // namespace Umbra::Platform
