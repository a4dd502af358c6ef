#pragma once

// ── Version ─────────────────────────────────────────────────
constexpr const char* CPPFORGE_VERSION = "0.4.0";

// ── Preset schema ───────────────────────────────────────────
// Range of CMakePresets.json "version" values the loader accepts.
constexpr int MIN_PRESET_SCHEMA_VERSION = 1;
constexpr int MAX_PRESET_SCHEMA_VERSION = 10;

// ── Default configuration values ────────────────────────────
constexpr const char* DEFAULT_PRESETS_PATH    = "CMakePresets.json";
constexpr const char* DEFAULT_GENERATOR       = "Ninja";
constexpr const char* DEFAULT_COMPOSE_FILE    = "docker-compose.yml";
constexpr const char* DEFAULT_CONTAINER_NAME  = "gcc-clang-dev";
constexpr const char* DEFAULT_BINARY_DIR      = "build";   // relative to ${sourceDir}

// ── Toolchain ───────────────────────────────────────────────
constexpr const char* CMAKE_PROGRAM           = "cmake";
constexpr const char* DOCKER_PROGRAM          = "docker";
constexpr const char* COMPOSE_SERVICE         = "dev";
constexpr const char* CONTAINER_SHELL         = "zsh";

// ── File names ──────────────────────────────────────────────
constexpr const char* CONFIG_FILE_NAME        = "cppforge.yaml";
constexpr const char* DEBUG_LOG_NAME          = "cppforge_debug.log";

// ── Exit codes ──────────────────────────────────────────────
constexpr int EXIT_GENERIC_FAILURE            = 1;
constexpr int EXIT_USAGE                      = 2;
constexpr int EXIT_SIGNAL_BASE                = 128;  // child killed by signal N -> 128 + N
