// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "cli_args.h"

#include <cstdio>
#include <cstdlib>
#include <cstring>

namespace turboplot {

namespace {

bool parse_int(const char* str, long min_val, long max_val, int& out, const char* name) {
    char* endptr;
    long val = strtol(str, &endptr, 10);
    if (*str == '\0' || *endptr != '\0' || val < min_val || val > max_val) {
        printf("Error: invalid %s (must be %ld-%ld): %s\n", name, min_val, max_val, str);
        return false;
    }
    out = static_cast<int>(val);
    return true;
}

bool parse_u64(const char* str, uint64_t min_val, uint64_t max_val, uint64_t& out,
               const char* name) {
    char* endptr;
    unsigned long long val = strtoull(str, &endptr, 10);
    if (*str == '\0' || *str == '-' || *endptr != '\0' || val < min_val || val > max_val) {
        printf("Error: invalid %s (must be %llu-%llu): %s\n", name,
               static_cast<unsigned long long>(min_val), static_cast<unsigned long long>(max_val),
               str);
        return false;
    }
    out = val;
    return true;
}

void print_help(const char* program_name) {
    printf("Usage: %s [options]\n", program_name);
    printf("Renders a synthetic trace through the tile cache and worker pool.\n");
    printf("Options:\n");
    printf("  -c, --config <path>  Configuration file (default: turboplot.json)\n");
    printf("  -b, --backend <name> Renderer for every worker: cpu, gpu\n");
    printf("  -w, --workers <n>    Number of workers (1-64)\n");
    printf("  -n, --samples <n>    Synthetic trace length (default: 1000000)\n");
    printf("  --size <WxH>         View size in pixels (default: 1280x720)\n");
    printf("  -z, --zoom-steps <n> Zoom in n times around the centre after the first view\n");
    printf("  -o, --output <path>  Write the final view as a PPM image\n");
    printf("  -v, --verbose        Increase verbosity (-v=info, -vv=debug, -vvv=trace)\n");
    printf("  -h, --help           Show this help message\n");
}

} // namespace

bool parse_cli_args(int argc, char** argv, CliArgs& args) {
    for (int i = 1; i < argc; i++) {
        const char* arg = argv[i];
        auto need_value = [&](const char* name) -> const char* {
            if (i + 1 >= argc) {
                printf("Error: %s requires an argument\n", name);
                return nullptr;
            }
            return argv[++i];
        };

        if (strcmp(arg, "-h") == 0 || strcmp(arg, "--help") == 0) {
            print_help(argv[0]);
            args.help_requested = true;
            return false;
        } else if (strcmp(arg, "-c") == 0 || strcmp(arg, "--config") == 0) {
            const char* v = need_value("-c/--config");
            if (!v)
                return false;
            args.config_path = v;
        } else if (strcmp(arg, "-b") == 0 || strcmp(arg, "--backend") == 0) {
            const char* v = need_value("-b/--backend");
            if (!v)
                return false;
            args.backend = parse_renderer_backend(v);
            if (!args.backend) {
                printf("Error: unknown backend '%s' (expected cpu or gpu)\n", v);
                return false;
            }
        } else if (strcmp(arg, "-w") == 0 || strcmp(arg, "--workers") == 0) {
            const char* v = need_value("-w/--workers");
            if (!v || !parse_int(v, 1, 64, args.workers, "worker count"))
                return false;
        } else if (strcmp(arg, "-n") == 0 || strcmp(arg, "--samples") == 0) {
            const char* v = need_value("-n/--samples");
            if (!v || !parse_u64(v, 2, uint64_t{1} << 31, args.samples, "sample count"))
                return false;
        } else if (strcmp(arg, "--size") == 0) {
            const char* v = need_value("--size");
            if (!v)
                return false;
            int w = 0, h = 0;
            char trailing = '\0';
            if (sscanf(v, "%dx%d%c", &w, &h, &trailing) != 2 || w <= 0 || h <= 0 || w > 16384 ||
                h > 16384) {
                printf("Error: invalid size '%s' (expected WxH, e.g. 1280x720)\n", v);
                return false;
            }
            args.view_width = w;
            args.view_height = h;
        } else if (strcmp(arg, "-z") == 0 || strcmp(arg, "--zoom-steps") == 0) {
            const char* v = need_value("-z/--zoom-steps");
            if (!v || !parse_int(v, 0, 100, args.zoom_steps, "zoom steps"))
                return false;
        } else if (strcmp(arg, "-o") == 0 || strcmp(arg, "--output") == 0) {
            const char* v = need_value("-o/--output");
            if (!v)
                return false;
            args.output_path = v;
        } else if (arg[0] == '-' && arg[1] == 'v' && strspn(arg + 1, "v") == strlen(arg + 1)) {
            args.verbosity += static_cast<int>(strlen(arg + 1));
        } else if (strcmp(arg, "--verbose") == 0) {
            args.verbosity++;
        } else {
            printf("Error: unknown argument '%s'\n", arg);
            printf("Use --help for usage information\n");
            return false;
        }
    }
    return true;
}

} // namespace turboplot
