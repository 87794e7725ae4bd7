#include <exception>
#include <string>
#include <unistd.h>
#include "app/cli_parser.hpp"
#include "core/config/session_id.hpp"
#include "core/errors/tool_errors.hpp"
#include "core/logging/logger.hpp"
#include "runtime/process_lifecycle.hpp"
#include "runtime/server_loop.hpp"

int main(int argc, char* argv[]) {
    // 1. Generate a session ID for this server process
    const std::string session_id = toolsrv::core::config::generate_session_id();

    // 2. Register the session ID with the Global Logger
    toolsrv::core::logging::Logger::get().set_session_id(session_id);

    // 3. Parse CLI input and return normalized input errors
    auto parsed = toolsrv::app::cli::parse_and_validate(argc, argv);
    if (toolsrv::core::errors::is_error(parsed)) {
        const auto& err = toolsrv::core::errors::get_error(parsed);
        LOG_ERROR("Input error [" + err.code + "]: " + err.message);
        if (!err.hint.empty()) {
            LOG_INFO("Hint: " + err.hint);
        }
        return 2;
    }
    const auto& config = toolsrv::core::errors::get_value(parsed);
    toolsrv::core::logging::Logger::get().set_min_level(config.log_level);

    // 4. Signals: SIGPIPE ignored, SIGTERM/SIGINT end the loop
    auto signals = toolsrv::runtime::install_signal_handlers();
    if (toolsrv::core::errors::is_error(signals)) {
        const auto& err = toolsrv::core::errors::get_error(signals);
        LOG_ERROR("Startup failed [" + err.code + "]: " + err.message);
        return 1;
    }

    LOG_INFO("Tool server starting: workspace=" + config.workspace_root.string() +
             " skills=" + config.skills_root.string());

    // 5. Serve until shutdown, idle timeout, EOF or a signal. Exit happens inside
    //    this scope so that running workers are abandoned, never joined.
    try {
        toolsrv::runtime::LoopChannels channels;
        channels.input_fd = STDIN_FILENO;
        channels.output_fd = STDOUT_FILENO;
        channels.signal_fd = toolsrv::core::errors::get_value(signals);

        toolsrv::runtime::ServerLoop loop(config, channels);
        const auto reason = loop.run();
        LOG_INFO("Tool server exiting: " + toolsrv::runtime::to_string(reason));
        toolsrv::runtime::exit_process(0);
    } catch (const std::exception& error) {
        LOG_ERROR(std::string("Fatal: ") + error.what());
        return 1;
    }
}
