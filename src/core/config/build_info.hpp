#pragma once
#include <string>

#ifndef EOLFIX_VERSION
#define EOLFIX_VERSION "dev"
#endif
#ifndef EOLFIX_COMMIT
#define EOLFIX_COMMIT "none"
#endif
#ifndef EOLFIX_BUILD_DATE
#define EOLFIX_BUILD_DATE "unknown"
#endif

namespace eolfix::core::config {

    // Build metadata, stamped by the build system at compile time.
    struct BuildInfo {
        std::string version;
        std::string commit;
        std::string date;
    };

    inline BuildInfo current_build_info() {
        return BuildInfo{EOLFIX_VERSION, EOLFIX_COMMIT, EOLFIX_BUILD_DATE};
    }

    inline std::string version_banner(const BuildInfo& info) {
        return "eolfix " + info.version + " (Built on " + info.date +
               " from Git SHA " + info.commit + ")";
    }

} // namespace eolfix::core::config
