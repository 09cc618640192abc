#include "classifier.hpp"
#include "strutil.hpp"
#include <algorithm>

namespace px {

const std::map<int, std::string> DEFAULT_PORT_LABELS = {
    {3000, "React/Next.js"},
    {3001, "React (alt)"},
    {4200, "Angular"},
    {5000, "Flask/.NET"},
    {5173, "Vite"},
    {8000, "Django/Python"},
    {8080, "Spring Boot/Tomcat"},
    {8888, "Jupyter"},
    {1313, "Hugo"},
    {3030, "Meteor"}
};

const std::vector<std::string> DEV_PROCESS_HINTS = {
    "node", "npm", "pnpm", "yarn", "vite", "webpack", "ng", "next", "nuxt",
    "python", "gunicorn", "uvicorn", "django", "flask", "dotnet", "java",
    "php", "rails"
};

const std::vector<std::string> DEV_COMMAND_HINTS = {
    "webpack", "vite", "nodemon", "ts-node", "next", "nuxt", "parcel",
    "rollup", "esbuild", "dev-server", "hot-reload", "live-server",
    "npm run dev", "yarn dev", "pnpm dev", "django runserver", "flask run",
    "rails server", "dotnet run", "dotnet watch"
};

std::map<int, std::string> mergePortLabels(const std::map<int, std::string>& overrides) {
    std::map<int, std::string> merged = DEFAULT_PORT_LABELS;
    for (const auto& kv : overrides) {
        merged[kv.first] = kv.second;
    }
    return merged;
}

static bool containsAny(const std::string& lowerText, const std::vector<std::string>& fragments) {
    return std::any_of(fragments.begin(), fragments.end(), [&lowerText](const std::string& f) {
        return lowerText.find(f) != std::string::npos;
    });
}

bool isDevProcess(const std::string& processName) {
    return containsAny(toLower(processName), DEV_PROCESS_HINTS);
}

bool hasDevCommand(const std::string& commandLine) {
    return containsAny(toLower(commandLine), DEV_COMMAND_HINTS);
}

bool isInWorkspace(const std::string& commandLine, const std::vector<std::string>& workspaceRoots) {
    std::string lower = toLower(commandLine);
    return std::any_of(workspaceRoots.begin(), workspaceRoots.end(), [&lower](const std::string& root) {
        return !root.empty() && lower.find(toLower(root)) != std::string::npos;
    });
}

Category classify(int port, const std::string& processName, const std::string& commandLine,
                  const ClassifierOptions& options) {
    if (options.portLabels.find(port) != options.portLabels.end()) {
        return Category::Dev;
    }

    bool devProcess = isDevProcess(processName);
    bool devCommand = hasDevCommand(commandLine);
    bool inWorkspace = isInWorkspace(commandLine, options.workspaceRoots);

    if (devProcess && (devCommand || inWorkspace)) {
        return Category::Dev;
    }

    if (options.strictWorkspace && !inWorkspace) {
        return Category::System;
    }

    return Category::System;
}

std::string labelFor(int port, const std::map<int, std::string>& portLabels) {
    auto it = portLabels.find(port);
    return it != portLabels.end() ? it->second : "";
}

} // namespace px
