#include "render_config.hpp"
#include "zoom_sequence.hpp"

#include <getopt.h>
#include <cerrno>
#include <cstdlib>
#include <climits>

enum LongOnlyOption {
    OPT_STOPS = 256,
    OPT_COLOR_SCALE,
    OPT_CYCLE,
    OPT_OFFSET,
    OPT_AUTO_ITER,
    OPT_NO_AVX,
    OPT_FRAMES,
    OPT_ZOOM_FACTOR,
    OPT_BENCHMARK,
};

static const struct option long_options[] = {
    {"center-re",   required_argument, nullptr, 'x'},
    {"center-im",   required_argument, nullptr, 'y'},
    {"scale",       required_argument, nullptr, 's'},
    {"zoom",        required_argument, nullptr, 'z'},
    {"width",       required_argument, nullptr, 'W'},
    {"height",      required_argument, nullptr, 'H'},
    {"max-iter",    required_argument, nullptr, 'i'},
    {"bound",       required_argument, nullptr, 'b'},
    {"palette",     required_argument, nullptr, 'p'},
    {"threads",     required_argument, nullptr, 't'},
    {"output",      required_argument, nullptr, 'o'},
    {"quiet",       no_argument,       nullptr, 'q'},
    {"help",        no_argument,       nullptr, 'h'},
    {"stops",       required_argument, nullptr, OPT_STOPS},
    {"color-scale", required_argument, nullptr, OPT_COLOR_SCALE},
    {"cycle",       required_argument, nullptr, OPT_CYCLE},
    {"offset",      required_argument, nullptr, OPT_OFFSET},
    {"auto-iter",   no_argument,       nullptr, OPT_AUTO_ITER},
    {"no-avx",      no_argument,       nullptr, OPT_NO_AVX},
    {"frames",      required_argument, nullptr, OPT_FRAMES},
    {"zoom-factor", required_argument, nullptr, OPT_ZOOM_FACTOR},
    {"benchmark",   no_argument,       nullptr, OPT_BENCHMARK},
    {nullptr,       0,                 nullptr, 0}
};

static bool parse_double(const char* s, double& out)
{
    char* end = nullptr;
    errno = 0;
    const double v = std::strtod(s, &end);
    if (end == s || *end != '\0' || errno == ERANGE)
        return false;
    out = v;
    return true;
}

static bool parse_int(const char* s, int& out)
{
    char* end = nullptr;
    errno = 0;
    const long v = std::strtol(s, &end, 10);
    if (end == s || *end != '\0' || errno == ERANGE || v < INT_MIN || v > INT_MAX)
        return false;
    out = static_cast<int>(v);
    return true;
}

static std::string bad_value(const char* opt, const char* value)
{
    return std::string("invalid value for ") + opt + ": '" + value + "'";
}

std::string parse_args(int argc, char* argv[], RenderConfig& cfg)
{
    optind = 0;   // full getopt reinitialisation (glibc), so parse_args can run twice
    opterr = 0;

    int opt;
    int option_index = 0;
    while ((opt = getopt_long(argc, argv, ":x:y:s:z:W:H:i:b:p:t:o:qh",
                              long_options, &option_index)) != -1) {
        switch (opt) {
            case 'x':
                if (!parse_double(optarg, cfg.center_re)) return bad_value("--center-re", optarg);
                break;
            case 'y':
                if (!parse_double(optarg, cfg.center_im)) return bad_value("--center-im", optarg);
                break;
            case 's':
                if (!parse_double(optarg, cfg.scale)) return bad_value("--scale", optarg);
                break;
            case 'z':
                if (!parse_double(optarg, cfg.zoom)) return bad_value("--zoom", optarg);
                break;
            case 'W':
                if (!parse_int(optarg, cfg.width)) return bad_value("--width", optarg);
                break;
            case 'H':
                if (!parse_int(optarg, cfg.height)) return bad_value("--height", optarg);
                break;
            case 'i':
                if (!parse_int(optarg, cfg.max_iter)) return bad_value("--max-iter", optarg);
                break;
            case 'b':
                if (!parse_double(optarg, cfg.bound)) return bad_value("--bound", optarg);
                break;
            case 'p':
                cfg.palette = optarg;
                break;
            case 't':
                if (!parse_int(optarg, cfg.threads)) return bad_value("--threads", optarg);
                break;
            case 'o':
                cfg.output = optarg;
                break;
            case 'q':
                cfg.quiet = true;
                break;
            case 'h':
                cfg.help = true;
                break;
            case OPT_STOPS:
                cfg.stops = optarg;
                break;
            case OPT_COLOR_SCALE:
                if (!color_scale_from_name(optarg, cfg.mapping.scale))
                    return bad_value("--color-scale", optarg);
                break;
            case OPT_CYCLE:
                if (!parse_double(optarg, cfg.mapping.cycle_length)) return bad_value("--cycle", optarg);
                break;
            case OPT_OFFSET:
                if (!parse_double(optarg, cfg.mapping.offset)) return bad_value("--offset", optarg);
                break;
            case OPT_AUTO_ITER:
                cfg.auto_iter = true;
                break;
            case OPT_NO_AVX:
                cfg.no_avx = true;
                break;
            case OPT_FRAMES:
                if (!parse_int(optarg, cfg.frames) || cfg.frames < 1)
                    return bad_value("--frames", optarg);
                break;
            case OPT_ZOOM_FACTOR:
                if (!parse_double(optarg, cfg.zoom_factor) || !(cfg.zoom_factor > 0.0))
                    return bad_value("--zoom-factor", optarg);
                break;
            case OPT_BENCHMARK:
                cfg.benchmark = true;
                break;
            case ':':
                return std::string("missing value for ") + argv[optind - 1];
            default:
                return std::string("unknown option ") + argv[optind - 1];
        }
    }
    if (optind < argc)
        return std::string("unexpected argument '") + argv[optind] + "'";
    if (cfg.frames > 0)
        return check_frame_pattern(cfg.output);
    return {};
}

std::string build_request(const RenderConfig& cfg, RenderRequest& out)
{
    RenderRequest req;

    if (!cfg.stops.empty()) {
        std::vector<ColorStop> stops;
        const std::string msg = parse_color_stops(cfg.stops, stops);
        if (!msg.empty())
            return msg;
        req.palette = Palette::custom(std::move(stops));
    } else {
        PaletteKind kind;
        if (!palette_from_name(cfg.palette, kind))
            return "unknown palette '" + cfg.palette + "'";
        req.palette = Palette::builtin(kind);
    }

    req.viewport.center_re = cfg.center_re;
    req.viewport.center_im = cfg.center_im;
    req.viewport.width     = cfg.width;
    req.viewport.height    = cfg.height;
    if (cfg.scale > 0.0)
        req.viewport.scale = cfg.scale;
    else if (cfg.zoom > 0.0 && cfg.width > 0)
        req.viewport.scale = scale_for_zoom(cfg.zoom, cfg.width);
    else
        req.viewport.scale = 0.0;   // rejected below

    req.max_iter = cfg.max_iter;
    req.bound    = cfg.bound;
    req.mapping  = cfg.mapping;

    const ConfigError err = validate(req);
    if (err != ConfigError::None)
        return config_error_message(err);

    // Grown only after validation so a budget <= 0 is still reported.
    if (cfg.auto_iter)
    {
        req.max_iter = detail_iterations(cfg.max_iter, zoom_level(req.viewport));
        const ConfigError grown_err = validate(req);
        if (grown_err != ConfigError::None)
            return config_error_message(grown_err);
    }

    out = std::move(req);
    return {};
}

void print_usage(FILE* out, const char* prog)
{
    std::fprintf(out,
        "Usage: %s [options]\n"
        "\n"
        "View\n"
        "  -x, --center-re RE     center real part            (default -0.5)\n"
        "  -y, --center-im IM     center imaginary part       (default 0)\n"
        "  -z, --zoom Z           magnification, 3.0/Z plane units across (default 1)\n"
        "  -s, --scale S          plane units per pixel (overrides --zoom)\n"
        "  -W, --width N          image width                 (default 800)\n"
        "  -H, --height N         image height                (default 600)\n"
        "\n"
        "Iteration\n"
        "  -i, --max-iter N       iteration budget            (default 256)\n"
        "  -b, --bound R          escape radius               (default 2)\n"
        "      --auto-iter        grow the budget with zoom\n"
        "\n"
        "Color\n"
        "  -p, --palette NAME     grayscale|rainbow|fire|ice|classic (default classic)\n"
        "      --stops LIST       custom palette, e.g. 0:000000,0.5:ff8000,1:ffffff\n"
        "      --color-scale S    cyclic|linear|log           (default cyclic)\n"
        "      --cycle N          iterations per palette sweep (default 64)\n"
        "      --offset F         palette offset in [0,1)     (default 0)\n"
        "\n"
        "Output\n"
        "  -o, --output PATH      .png%s                 (default mandelbrot.png)\n"
        "      --frames N         render a zoom sequence of N frames\n"
        "      --zoom-factor F    per-frame zoom of the sequence (default 1.1)\n"
        "\n"
        "Runtime\n"
        "  -t, --threads N        worker threads, 0 = auto    (default 0)\n"
        "      --no-avx           force the scalar evaluator\n"
        "      --benchmark        run the CPU benchmark and exit\n"
        "  -q, --quiet            only report errors\n"
        "  -h, --help             show this help\n",
        prog,
#ifdef HAVE_JXL
        " or .jxl"
#else
        "       "
#endif
        );
}
