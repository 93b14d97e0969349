#pragma once

#include <iostream>
#include <memory>
#include <string>
#include "spdlog/spdlog.h"
#include "spdlog/sinks/stdout_color_sinks.h"
#include "spdlog/sinks/basic_file_sink.h"
#include "spdlog/sinks/dist_sink.h"

class dh_logger
{
    public:
    std::shared_ptr<spdlog::logger> main;

    std::shared_ptr<spdlog::logger> chd;
    std::shared_ptr<spdlog::logger> map;
    std::shared_ptr<spdlog::logger> codec;
    std::shared_ptr<spdlog::logger> cache;
    std::shared_ptr<spdlog::logger> parent;
    std::shared_ptr<spdlog::logger> verify;
    std::shared_ptr<spdlog::logger> cdrom;

    dh_logger();

    //Mirror everything (trace and up) to a file as well as the console
    void add_file_sink(const std::string& path);
    void set_console_level(spdlog::level::level_enum level);

    private:
    std::shared_ptr<spdlog::sinks::dist_sink_mt> main_sink;
    std::shared_ptr<spdlog::sinks::stdout_color_sink_mt> console_sink;
};

extern dh_logger* dh_log;
