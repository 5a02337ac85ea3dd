// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "cli_args.h"

#include <cstdio>
#include <cstdlib>
#include <cstring>

#ifndef PRINTCAST_VERSION
#define PRINTCAST_VERSION "dev"
#endif

namespace printcast {

// Helper to parse integer with validation
static bool parse_int(const char* str, long min_val, long max_val, int& out, const char* name) {
    char* endptr;
    long val = strtol(str, &endptr, 10);
    if (*endptr != '\0' || endptr == str || val < min_val || val > max_val) {
        printf("Error: invalid %s (must be %ld-%ld): %s\n", name, min_val, max_val, str);
        return false;
    }
    out = static_cast<int>(val);
    return true;
}

// Accepts "--flag value" and "--flag=value"
static const char* option_value(int argc, char** argv, int& i, const char* flag) {
    size_t len = strlen(flag);
    if (strncmp(argv[i], flag, len) == 0 && argv[i][len] == '=') {
        return argv[i] + len + 1;
    }
    if (i + 1 < argc) {
        return argv[++i];
    }
    printf("Error: %s requires an argument\n", flag);
    return nullptr;
}

static bool matches_option(const char* arg, const char* flag) {
    size_t len = strlen(flag);
    return strncmp(arg, flag, len) == 0 && (arg[len] == '\0' || arg[len] == '=');
}

static void print_help(const char* program_name) {
    printf("printcast %s - network monitor for SDCP resin printers\n\n", PRINTCAST_VERSION);
    printf("Usage: %s [options]\n", program_name);
    printf("Options:\n");
    printf("  -p, --port <n>       HTTP/WebSocket listen port (default: 3000, env PORT)\n");
    printf("  --printer <ip>       Connect to this printer only (env PRINTER_IP)\n");
    printf("  -v, --verbose        Increase verbosity (-v=info, -vv=debug, -vvv=trace)\n");
    printf("  --log-dest <dest>    Log destination: auto, syslog, file, console\n");
    printf("  --log-file <path>    Log file path (when --log-dest=file)\n");
    printf("  -h, --help           Show this help message\n");
    printf("\nWithout --printer, printers are discovered on the local network and the\n");
    printf("first reachable one is used, failing over to the next when it goes away.\n");
}

bool parse_cli_args(int argc, char** argv, CliArgs& args) {
    for (int i = 1; i < argc; i++) {
        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_help(argv[0]);
            args.help_requested = true;
            return false;
        }
        // Listen port
        else if (strcmp(argv[i], "-p") == 0 || matches_option(argv[i], "--port")) {
            const char* value = strcmp(argv[i], "-p") == 0
                                    ? (i + 1 < argc ? argv[++i] : nullptr)
                                    : option_value(argc, argv, i, "--port");
            if (!value) {
                printf("Error: -p/--port requires a number argument\n");
                return false;
            }
            if (!parse_int(value, 1, 65535, args.port, "port"))
                return false;
        }
        // Fixed printer
        else if (matches_option(argv[i], "--printer")) {
            const char* value = option_value(argc, argv, i, "--printer");
            if (!value || value[0] == '\0') {
                printf("Error: --printer requires an IP address\n");
                return false;
            }
            args.printer_ip = value;
        }
        // Verbosity
        else if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "-vv") == 0 ||
                 strcmp(argv[i], "-vvv") == 0) {
            const char* p = argv[i];
            while (*p == '-')
                p++;
            while (*p == 'v') {
                args.verbosity++;
                p++;
            }
        } else if (strcmp(argv[i], "--verbose") == 0) {
            args.verbosity++;
        }
        // Log destination
        else if (matches_option(argv[i], "--log-dest")) {
            const char* value = option_value(argc, argv, i, "--log-dest");
            if (!value)
                return false;
            args.log_dest = value;
            if (args.log_dest != "auto" && args.log_dest != "syslog" && args.log_dest != "file" &&
                args.log_dest != "console") {
                printf("Error: invalid --log-dest value: %s\n", args.log_dest.c_str());
                printf("Valid values: auto, syslog, file, console\n");
                return false;
            }
        } else if (matches_option(argv[i], "--log-file")) {
            const char* value = option_value(argc, argv, i, "--log-file");
            if (!value)
                return false;
            args.log_file = value;
        } else {
            printf("Error: unknown argument: %s\n", argv[i]);
            printf("Run '%s --help' for usage\n", argv[0]);
            return false;
        }
    }

    return true;
}

} // namespace printcast
