#include "logger.hpp"

dh_logger* dh_log = new dh_logger;

dh_logger::dh_logger()
{
    try
    {
        // This is the sink for writing to console. Quiet by default, the library is usually embedded.
        console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_pattern("[%n] %v");
        console_sink->set_level(spdlog::level::warn);

        // File sinks get added to this later on if someone wants a log file.
        main_sink = std::make_shared<spdlog::sinks::dist_sink_mt>();
        main_sink->add_sink(console_sink);

        // And the main logger and everything cloned from it uses that sink.
        main = std::make_shared<spdlog::logger>("DH", main_sink);
        main->set_level(spdlog::level::trace);
        spdlog::register_logger(main);

        chd = spdlog::get("DH")->clone("CHD");
        map = spdlog::get("DH")->clone("MAP");
        codec = spdlog::get("DH")->clone("CODEC");
        cache = spdlog::get("DH")->clone("CACHE");
        parent = spdlog::get("DH")->clone("PARENT");
        verify = spdlog::get("DH")->clone("VERIFY");
        cdrom = spdlog::get("DH")->clone("CDROM");
    }
    catch (const spdlog::spdlog_ex& ex)
    {
        std::cout << "Log initialization failed: " << ex.what() << std::endl;
    }
}

void dh_logger::add_file_sink(const std::string& path)
{
    // Note that the level logged to it is separate from the console.
    auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path, true);
    file_sink->set_pattern("[%H:%M:%S %z] [%n] %v");
    file_sink->set_level(spdlog::level::trace);
    main_sink->add_sink(file_sink);
}

void dh_logger::set_console_level(spdlog::level::level_enum level)
{
    console_sink->set_level(level);
}
