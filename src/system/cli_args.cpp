// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "cli_args.h"

#include <cstdio>
#include <cstdlib>
#include <cstring>

namespace printdesk {

// Helper to parse integer with validation
static bool parse_int(const char* str, long min_val, long max_val, int& out, const char* name) {
    char* endptr;
    long val = strtol(str, &endptr, 10);
    if (*str == '\0' || *endptr != '\0' || val < min_val || val > max_val) {
        printf("Error: invalid %s (must be %ld-%ld): %s\n", name, min_val, max_val, str);
        return false;
    }
    out = static_cast<int>(val);
    return true;
}

/// Value of `--opt=value` or `--opt value`; nullptr (with message) if missing
static const char* option_value(int argc, char** argv, int& i, const char* opt) {
    size_t len = strlen(opt);
    if (strncmp(argv[i], opt, len) == 0 && argv[i][len] == '=') {
        return argv[i] + len + 1;
    }
    if (i + 1 < argc) {
        return argv[++i];
    }
    printf("Error: %s requires an argument\n", opt);
    return nullptr;
}

static bool matches(const char* arg, const char* opt) {
    size_t len = strlen(opt);
    return strcmp(arg, opt) == 0 || (strncmp(arg, opt, len) == 0 && arg[len] == '=');
}

static void print_help(const char* program_name) {
    printf("Usage: %s [options]\n", program_name);
    printf("Options:\n");
    printf("  -c, --config <path>  Configuration file (default: printdesk.json)\n");
    printf("  -p, --port <n>       HTTP port (overrides config)\n");
    printf("  -v, --verbose        Increase verbosity (-v=info, -vv=debug, -vvv=trace)\n");
    printf("  --log-dest <dest>    Log destination: auto, journal, syslog, file, console\n");
    printf("  --log-file <path>    Log file path (when --log-dest=file)\n");
    printf("  -h, --help           Show this help message\n");
}

bool parse_cli_args(int argc, char** argv, CliArgs& args) {
    for (int i = 1; i < argc; i++) {
        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_help(argv[0]);
            args.help = true;
            return false;
        } else if (strcmp(argv[i], "-c") == 0 || matches(argv[i], "--config")) {
            const char* value =
                strcmp(argv[i], "-c") == 0
                    ? (i + 1 < argc ? argv[++i] : nullptr)
                    : option_value(argc, argv, i, "--config");
            if (!value) {
                printf("Error: --config requires a path argument\n");
                return false;
            }
            args.config_path = value;
        } else if (strcmp(argv[i], "-p") == 0 || matches(argv[i], "--port")) {
            const char* value =
                strcmp(argv[i], "-p") == 0
                    ? (i + 1 < argc ? argv[++i] : nullptr)
                    : option_value(argc, argv, i, "--port");
            if (!value) {
                printf("Error: --port requires a numeric argument\n");
                return false;
            }
            if (!parse_int(value, 1, 65535, args.port, "port"))
                return false;
        }
        // Verbosity
        else if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "-vv") == 0 ||
                 strcmp(argv[i], "-vvv") == 0) {
            if (args.verbosity < 0)
                args.verbosity = 0;
            const char* p = argv[i];
            while (*p == '-')
                p++;
            while (*p == 'v') {
                args.verbosity++;
                p++;
            }
        } else if (strcmp(argv[i], "--verbose") == 0) {
            if (args.verbosity < 0)
                args.verbosity = 0;
            args.verbosity++;
        }
        // Log destination
        else if (matches(argv[i], "--log-dest")) {
            const char* value = option_value(argc, argv, i, "--log-dest");
            if (!value)
                return false;
            args.log_dest = value;
            if (args.log_dest != "auto" && args.log_dest != "journal" &&
                args.log_dest != "syslog" && args.log_dest != "file" &&
                args.log_dest != "console") {
                printf("Error: invalid --log-dest value: %s\n", args.log_dest.c_str());
                printf("Valid values: auto, journal, syslog, file, console\n");
                return false;
            }
        } else if (matches(argv[i], "--log-file")) {
            const char* value = option_value(argc, argv, i, "--log-file");
            if (!value)
                return false;
            args.log_file = value;
        } else {
            printf("Error: unknown argument: %s\n", argv[i]);
            printf("Use --help for usage information\n");
            return false;
        }
    }
    return true;
}

} // namespace printdesk
