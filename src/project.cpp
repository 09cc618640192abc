#include "project.hpp"
#include "strutil.hpp"
#include <utility>

namespace px {

const std::vector<std::string> PROJECT_MANIFESTS = {
    "package.json", "requirements.txt", "Gemfile", "composer.json", "pom.xml"
};

// Meta-frameworks come before the framework they build on
static const std::vector<std::pair<std::string, std::string>> NODE_FRAMEWORKS = {
    {"next", "Next.js"},
    {"nuxt", "Nuxt"},
    {"react", "React"},
    {"vue", "Vue"},
    {"@angular/core", "Angular"},
    {"vite", "Vite"}
};

std::string detectNodeFramework(const json& manifest) {
    json deps = json::object();
    if (manifest.is_object()) {
        for (const char* section : {"dependencies", "devDependencies"}) {
            auto it = manifest.find(section);
            if (it != manifest.end() && it->is_object()) {
                deps.update(*it);
            }
        }
    }

    for (const auto& fw : NODE_FRAMEWORKS) {
        if (deps.contains(fw.first)) {
            return fw.second;
        }
    }
    return "Node.js";
}

static std::string detectPythonFramework(const std::string& requirements) {
    std::string txt = toLower(requirements);
    if (txt.find("django") != std::string::npos) return "Django";
    if (txt.find("flask") != std::string::npos) return "Flask";
    return "Python";
}

static std::string detectRubyFramework(const std::string& gemfile) {
    return toLower(gemfile).find("rails") != std::string::npos ? "Ruby on Rails" : "Ruby";
}

static std::string detectPhpFramework(const json& composer) {
    if (composer.is_object()) {
        auto it = composer.find("require");
        if (it != composer.end() && it->is_object() && it->contains("laravel/framework")) {
            return "Laravel";
        }
    }
    return "PHP";
}

static std::string detectJavaFramework(const std::string& pom) {
    return toLower(pom).find("spring-boot") != std::string::npos ? "Spring Boot" : "Java/Maven";
}

std::optional<ProjectInfo> detectProject(const std::string& workingDirectory,
                                         const FileSystem& fs,
                                         DiagnosticLog* diag) {
    if (workingDirectory.empty() || !fs.exists(workingDirectory)) {
        return std::nullopt;
    }

    try {
        std::string framework = "Unknown";

        for (const auto& manifest : PROJECT_MANIFESTS) {
            std::string path = joinPath(workingDirectory, manifest);
            if (!fs.exists(path)) continue;

            auto content = fs.readFile(path);
            if (!content) {
                throw std::runtime_error("cannot read " + path);
            }

            if (manifest == "package.json") {
                framework = detectNodeFramework(json::parse(*content));
            } else if (manifest == "requirements.txt") {
                framework = detectPythonFramework(*content);
            } else if (manifest == "Gemfile") {
                framework = detectRubyFramework(*content);
            } else if (manifest == "composer.json") {
                framework = detectPhpFramework(json::parse(*content));
            } else {
                framework = detectJavaFramework(*content);
            }
            break;
        }

        ProjectInfo info;
        info.name = baseName(workingDirectory);
        info.path = workingDirectory;
        info.framework = framework;
        return info;

    } catch (const std::exception& e) {
        if (diag) {
            diag->warning("detector", "project detection failed for " + workingDirectory + ": " + e.what());
        }
        return std::nullopt;
    }
}

} // namespace px
