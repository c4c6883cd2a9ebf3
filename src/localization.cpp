#include "localization.hpp"
#include "config.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <mutex>
#include <string>
#include <unordered_map>

namespace {
    using Catalog = std::unordered_map<std::string, std::string>;

    Catalog catalog;
    // Placeholders for missing keys; get_string is called from query threads.
    Catalog placeholders;
    std::mutex placeholder_mutex;

    bool load_catalog(const std::string& lang) {
        std::ifstream in(L10N_DIR / (lang + ".txt"));
        if (!in) return false;

        for (std::string line; std::getline(in, line);) {
            if (!line.empty() && line.back() == '\r') line.pop_back();
            if (line.empty() || line.front() == '#') continue;
            const auto eq = line.find('=');
            if (eq == std::string::npos) continue;
            catalog.insert_or_assign(line.substr(0, eq), line.substr(eq + 1));
        }
        return true;
    }

    std::string preferred_language() {
        const char* lang = std::getenv("LANG");
        if (lang && std::string_view(lang).starts_with("zh")) return "zh";
        return "en";
    }
}

void init_localization() {
    catalog.clear();
    const std::string lang = preferred_language();
    if (load_catalog(lang) || lang == "en") return;

    // Logging is not usable before a catalog is loaded.
    std::cerr << "Could not open localization file for " << lang << ", falling back to English." << std::endl;
    load_catalog("en");
}

const std::string& get_string(const std::string& key) {
    if (auto it = catalog.find(key); it != catalog.end()) return it->second;

    std::lock_guard<std::mutex> lock(placeholder_mutex);
    auto [it, inserted] = placeholders.try_emplace(key);
    if (inserted) it->second = "[MISSING_STRING: " + key + "]";
    return it->second;
}
