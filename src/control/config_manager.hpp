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

// Switchback Configuration Manager - Header
// Runtime backend toggles with atomic, backed-up persistence

#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>

#include "config.hpp"

namespace switchback::control {

/// Errors returned by backend toggles
enum class ConfigErrc {
    backend_not_found = 1,
    already_enabled,
    already_disabled,
    persist_failed,
};

class ConfigErrorCategory : public std::error_category {
public:
    [[nodiscard]] const char* name() const noexcept override { return "switchback.config"; }

    [[nodiscard]] std::string message(int ev) const override;
};

[[nodiscard]] const ConfigErrorCategory& config_category() noexcept;

[[nodiscard]] std::error_code make_error_code(ConfigErrc errc) noexcept;

/// Owns the loaded configuration and writes toggles back to disk.
///
/// Readers take a snapshot with get(); writers build a modified copy, persist
/// it and only then publish it, so a failed write leaves memory and disk
/// unchanged. Persisting copies the previous file to
/// <dir>/backups/config.YYYYMMDD-HHMMSS.json (newest MAX_BACKUPS kept), writes
/// <path>.tmp and renames it over the original.
class ConfigManager {
public:
    static constexpr size_t MAX_BACKUPS = 5;

    ConfigManager() = default;
    ~ConfigManager() = default;

    // Non-copyable, non-movable
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    /// Load initial configuration
    [[nodiscard]] bool load(std::string_view path);

    /// Re-read the configuration file
    [[nodiscard]] bool reload();

    /// Get current configuration (thread-safe read)
    [[nodiscard]] std::shared_ptr<const Config> get() const noexcept;

    [[nodiscard]] std::error_code enable_backend(std::string_view name);

    [[nodiscard]] std::error_code disable_backend(std::string_view name);

    /// Get configuration file path
    [[nodiscard]] std::string_view config_path() const noexcept { return config_path_; }

    /// Check if configuration is loaded
    [[nodiscard]] bool is_loaded() const noexcept { return get() != nullptr; }

    /// Get last validation result
    [[nodiscard]] const ValidationResult& last_validation() const noexcept {
        return last_validation_;
    }

private:
    [[nodiscard]] std::error_code set_enabled(std::string_view name, bool enabled);
    [[nodiscard]] bool persist(const Config& config);
    [[nodiscard]] bool write_backup();
    void prune_backups(const std::string& backup_dir);

    std::string config_path_;
    std::shared_ptr<const Config> current_config_;
    ValidationResult last_validation_;
    std::mutex write_mutex_;  // Serializes toggles and reloads
};

}  // namespace switchback::control

template <>
struct std::is_error_code_enum<switchback::control::ConfigErrc> : std::true_type {};
