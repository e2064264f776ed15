/*
 * Copyright 2026 Switchback Contributors
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

// Switchback Configuration Manager - Implementation

#include "config_manager.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <atomic>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <vector>

#include "../core/logging.hpp"

namespace switchback::control {

namespace fs = std::filesystem;

std::string ConfigErrorCategory::message(int ev) const {
    switch (static_cast<ConfigErrc>(ev)) {
        case ConfigErrc::backend_not_found:
            return "backend not found";
        case ConfigErrc::already_enabled:
            return "backend is already enabled";
        case ConfigErrc::already_disabled:
            return "backend is already disabled";
        case ConfigErrc::persist_failed:
            return "failed to persist configuration";
    }
    return "unknown configuration error";
}

const ConfigErrorCategory& config_category() noexcept {
    static const ConfigErrorCategory category;
    return category;
}

std::error_code make_error_code(ConfigErrc errc) noexcept {
    return {static_cast<int>(errc), config_category()};
}

bool ConfigManager::load(std::string_view path) {
    std::lock_guard lock(write_mutex_);
    config_path_ = path;

    auto maybe_config = ConfigLoader::load_from_file(path);
    if (!maybe_config.has_value()) {
        return false;
    }

    last_validation_ = ConfigLoader::validate(*maybe_config);
    if (last_validation_.has_errors()) {
        return false;
    }

    std::atomic_store(&current_config_, std::make_shared<const Config>(std::move(*maybe_config)));
    return true;
}

bool ConfigManager::reload() {
    std::lock_guard lock(write_mutex_);
    if (config_path_.empty()) {
        return false;
    }

    auto maybe_config = ConfigLoader::load_from_file(config_path_);
    if (!maybe_config.has_value()) {
        return false;
    }

    last_validation_ = ConfigLoader::validate(*maybe_config);
    if (last_validation_.has_errors()) {
        return false;
    }

    // Old snapshot stays valid until all readers release their references
    std::atomic_store(&current_config_, std::make_shared<const Config>(std::move(*maybe_config)));
    return true;
}

std::shared_ptr<const Config> ConfigManager::get() const noexcept {
    return std::atomic_load(&current_config_);
}

std::error_code ConfigManager::enable_backend(std::string_view name) {
    return set_enabled(name, true);
}

std::error_code ConfigManager::disable_backend(std::string_view name) {
    return set_enabled(name, false);
}

std::error_code ConfigManager::set_enabled(std::string_view name, bool enabled) {
    std::lock_guard lock(write_mutex_);

    auto current = get();
    if (!current) {
        return ConfigErrc::backend_not_found;
    }

    auto it = std::find_if(current->backends.begin(), current->backends.end(),
                           [&](const BackendConfig& b) { return b.name == name; });
    if (it == current->backends.end()) {
        return ConfigErrc::backend_not_found;
    }
    if (it->enabled == enabled) {
        return enabled ? ConfigErrc::already_enabled : ConfigErrc::already_disabled;
    }

    Config updated = *current;
    updated.backends[static_cast<size_t>(it - current->backends.begin())].enabled = enabled;

    if (!persist(updated)) {
        return ConfigErrc::persist_failed;
    }

    std::atomic_store(&current_config_, std::make_shared<const Config>(std::move(updated)));
    LOG_INFO(logging::get_logger(), "config: backend {} {} and saved to {}", name,
             enabled ? "enabled" : "disabled", config_path_);
    return {};
}

bool ConfigManager::persist(const Config& config) {
    auto* logger = logging::get_logger();

    if (!write_backup()) {
        return false;
    }

    std::string tmp_path = config_path_ + ".tmp";
    if (!ConfigLoader::save_to_file(config, tmp_path)) {
        LOG_ERROR(logger, "config: cannot write {}", tmp_path);
        std::error_code ignored;
        fs::remove(tmp_path, ignored);
        return false;
    }

    std::error_code ec;
    fs::rename(tmp_path, config_path_, ec);
    if (ec) {
        LOG_ERROR(logger, "config: cannot replace {}: {}", config_path_, ec.message());
        std::error_code ignored;
        fs::remove(tmp_path, ignored);
        return false;
    }
    return true;
}

bool ConfigManager::write_backup() {
    auto* logger = logging::get_logger();
    fs::path config_file{config_path_};

    std::error_code ec;
    if (!fs::exists(config_file, ec)) {
        return true;  // Nothing to back up yet
    }

    fs::path backup_dir = config_file.parent_path() / "backups";
    fs::create_directories(backup_dir, ec);
    if (ec) {
        LOG_ERROR(logger, "config: cannot create {}: {}", backup_dir.string(), ec.message());
        return false;
    }

    std::time_t now = std::time(nullptr);
    std::tm local{};
    localtime_r(&now, &local);
    char stamp[32];
    std::strftime(stamp, sizeof(stamp), "%Y%m%d-%H%M%S", &local);

    fs::path backup_path = backup_dir / fmt::format("config.{}.json", stamp);
    fs::copy_file(config_file, backup_path, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        LOG_ERROR(logger, "config: cannot write backup {}: {}", backup_path.string(), ec.message());
        return false;
    }

    prune_backups(backup_dir.string());
    return true;
}

void ConfigManager::prune_backups(const std::string& backup_dir) {
    std::error_code ec;
    std::vector<std::pair<fs::file_time_type, fs::path>> backups;

    for (const auto& entry : fs::directory_iterator(backup_dir, ec)) {
        std::string filename = entry.path().filename().string();
        std::error_code time_ec;
        if (!entry.is_regular_file(time_ec) || !filename.starts_with("config.") ||
            !filename.ends_with(".json")) {
            continue;
        }
        auto mtime = entry.last_write_time(time_ec);
        if (!time_ec) {
            backups.emplace_back(mtime, entry.path());
        }
    }
    if (ec || backups.size() <= MAX_BACKUPS) {
        return;
    }

    // Newest first; same-second backups fall back to the name (which embeds the time)
    std::sort(backups.begin(), backups.end(), [](const auto& a, const auto& b) {
        return a.first != b.first ? a.first > b.first : a.second > b.second;
    });

    for (size_t i = MAX_BACKUPS; i < backups.size(); ++i) {
        std::error_code remove_ec;
        if (!fs::remove(backups[i].second, remove_ec)) {
            LOG_WARNING(logging::get_logger(), "config: cannot remove old backup {}: {}",
                        backups[i].second.string(), remove_ec.message());
        }
    }
}

}  // namespace switchback::control
