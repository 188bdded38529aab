#include <atomic>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <unistd.h>

#include "camera.hpp"
#include "display_sink.hpp"
#include "gesture_resolver.hpp"
#include "landmark_stream.hpp"
#include "painter_config.hpp"
#include "pipeline.hpp"
#include "toolbar.hpp"

static std::atomic<bool> g_stop_requested{false};

static void handle_signal(int)
{
    g_stop_requested.store(true);
}

static void print_usage()
{
    std::cout << "AirPaint Options:\n"
              << "  --config <path>         Load key/value configuration file\n"
              << "  --landmarks-cmd <cmd>   Hand landmark producer (JSON lines on stdout)\n"
              << "  --landmarks-file <path> Replay recorded landmark JSON lines\n"
              << "  --camera-cmd <cmd>      Capture command (raw YUV420 on stdout)\n"
              << "  --display-cmd <cmd>     Player command (raw RGB24 on stdin)\n"
              << "  --snapshots <dir>       Write composited frames as PPM files\n"
              << "  --headers <dir>         Toolbar header images (PPM)\n"
              << "  --max-frames <n>        Stop after n frames\n"
              << "  --save-config <path>    Write the effective configuration and exit\n"
              << "  --verbose               Log gesture changes\n"
              << "  --help                  Show this help\n\n"
              << "Gestures: index finger draws, index+middle selects a color on the toolbar,\n"
              << "open palm clears the canvas. Type q + Enter or press Ctrl+C to quit.\n";
}

int main(int argc, char **argv)
{
    painter::PainterConfig config;
    std::string save_config_path;

    // ---------------------------------------------------------------------------
    // Startup argument parsing (lightweight, no external deps).
    // The config file is applied first so flags can override it.
    // ---------------------------------------------------------------------------
    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc)
        {
            if (!config.load_from_file(argv[++i]))
            {
                std::cerr << "[Config][ERROR] Invalid configuration: " << argv[i] << "\n";
                return EXIT_FAILURE;
            }
        }
        else if (arg == "--help" || arg == "-h")
        {
            print_usage();
            return 0;
        }
    }

    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        bool has_value = i + 1 < argc;
        if (arg == "--config" && has_value)
            ++i;
        else if (arg == "--landmarks-cmd" && has_value)
            config.landmark_cmd = argv[++i];
        else if (arg == "--landmarks-file" && has_value)
            config.landmark_file = argv[++i];
        else if (arg == "--camera-cmd" && has_value)
            config.camera_cmd = argv[++i];
        else if (arg == "--display-cmd" && has_value)
            config.display_cmd = argv[++i];
        else if (arg == "--snapshots" && has_value)
            config.snapshot_dir = argv[++i];
        else if (arg == "--headers" && has_value)
            config.header_dir = argv[++i];
        else if (arg == "--max-frames" && has_value)
        {
            char *end = nullptr;
            long long frames = std::strtoll(argv[++i], &end, 10);
            if (end == argv[i] || *end != '\0' || frames < 0)
            {
                std::cerr << "[AirPaint][ERROR] Bad --max-frames value: " << argv[i] << "\n";
                return EXIT_FAILURE;
            }
            config.max_frames = static_cast<uint64_t>(frames);
        }
        else if (arg == "--save-config" && has_value)
            save_config_path = argv[++i];
        else if (arg == "--verbose")
            config.verbose = true;
        else
        {
            std::cerr << "Unknown or incomplete option: " << arg << "\n";
            print_usage();
            return EXIT_FAILURE;
        }
    }

    if (!config.validate())
    {
        std::cerr << "[Config][ERROR] Configuration failed validation\n";
        return EXIT_FAILURE;
    }

    if (!save_config_path.empty())
    {
        return config.save_to_file(save_config_path) ? 0 : EXIT_FAILURE;
    }

    if (config.landmark_cmd.empty() && config.landmark_file.empty())
    {
        std::cerr << "[Config][ERROR] A landmark source is required (--landmarks-cmd or --landmarks-file)\n";
        return EXIT_FAILURE;
    }

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    // Toolbar headers: prefer images on disk, otherwise draw swatches
    painter::Toolbar toolbar;
    if (config.header_dir.empty() || !toolbar.load_directory(config.header_dir))
    {
        if (!config.header_dir.empty())
            std::cerr << "[Toolbar][WARN] Falling back to generated headers\n";
        toolbar.synthesize(config.width, painter::constants::kHeaderHeight, config.resolver);
    }

    // Frame source
    camera::CameraConfig cam_cfg;
    cam_cfg.width = config.width;
    cam_cfg.height = config.height;
    cam_cfg.framerate = config.framerate;
    cam_cfg.format = config.camera_rgb ? camera::PixelFormat::RGB888 : camera::PixelFormat::YUV420;
    cam_cfg.command = config.camera_cmd;
    cam_cfg.verbose = config.verbose;

    camera::Camera cam;
    if (!cam.init(cam_cfg) || !cam.start())
    {
        std::cerr << "[Camera][ERROR] " << cam.get_error() << "\n";
        return EXIT_FAILURE;
    }

    // Pose estimator
    hand_tracking::LandmarkStreamConfig lm_cfg;
    lm_cfg.command = config.landmark_cmd;
    lm_cfg.path = config.landmark_file;
    lm_cfg.min_confidence = config.detection_confidence;
    lm_cfg.verbose = config.verbose;

    hand_tracking::LandmarkStream landmarks;
    if (!landmarks.init(lm_cfg))
    {
        std::cerr << "[LandmarkStream][ERROR] " << landmarks.get_error() << "\n";
        return EXIT_FAILURE;
    }

    // Display sink
    std::unique_ptr<painter::DisplaySink> display;
    if (!config.snapshot_dir.empty())
    {
        display = std::make_unique<painter::PpmDisplaySink>(config.snapshot_dir, config.snapshot_every);
    }
    else
    {
        std::string cmd = config.display_cmd.empty()
                              ? painter::PipeDisplaySink::default_command(config.width, config.height, config.framerate)
                              : config.display_cmd;
        auto pipe_sink = std::make_unique<painter::PipeDisplaySink>(cmd);
        if (!pipe_sink->open())
        {
            std::cerr << "[Display][ERROR] " << pipe_sink->get_error() << "\n";
            return EXIT_FAILURE;
        }
        display = std::move(pipe_sink);
    }

    // Quit on "q" typed at an interactive terminal
    pipeline::QuitKeyWatcher quit_watcher(STDIN_FILENO, g_stop_requested);
    if (isatty(STDIN_FILENO))
        quit_watcher.start();

    gesture::PaintSession session(config.width, config.height, config.resolver);

    pipeline::PipelineConfig pipe_cfg;
    pipe_cfg.mirror = config.mirror;
    pipe_cfg.draw_landmarks = config.draw_landmarks;
    pipe_cfg.mask_threshold = config.mask_threshold;
    pipe_cfg.max_frames = config.max_frames;
    pipe_cfg.verbose = config.verbose;

    pipeline::Pipeline loop(pipe_cfg, cam, landmarks, session, toolbar, *display);

    std::cerr << "[AirPaint] Running at " << config.width << "x" << config.height
              << " (Ctrl+C to quit)\n";
    bool ok = loop.run(g_stop_requested);

    g_stop_requested.store(true);
    quit_watcher.stop();
    cam.stop();
    landmarks.close();
    loop.print_stats(std::cerr);

    if (!ok)
    {
        // End of a recorded landmark file is a normal way to finish a replay
        if (!config.landmark_file.empty() && landmarks.get_error() == "End of landmark stream")
            return 0;
        std::cerr << "[AirPaint] Stopped: " << loop.get_error() << "\n";
        return EXIT_FAILURE;
    }
    return 0;
}
