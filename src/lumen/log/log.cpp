#include <lumen/log/log.hpp>

#include <array>
#include <chrono>
#include <string>
#include <utility>

#include <quill/Backend.h>
#include <quill/backend/BackendOptions.h>
#include <quill/sinks/ConsoleSink.h>

namespace lumen::log {

void initialize( quill::LogLevel level ) noexcept
{
  constexpr auto sleep_duration = std::chrono::milliseconds{ 100 };

  quill::BackendOptions options;
  options.sleep_duration = sleep_duration;
  options.error_notifier = []( const std::string& err ) noexcept
  {
    LOG_ERROR( lumen::log::instance(), "Encountered backend logging error: {}", err );
  };

  quill::Backend::start( options );
  instance()->set_log_level( level );
}

logger* instance() noexcept
{
  static auto logger = frontend::create_or_get_logger(
    "root",
    frontend::create_or_get_sink< quill::ConsoleSink >( "console_sink_id_1" ),
    quill::PatternFormatterOptions{ "%(time) [%(thread_id)] %(short_source_location:<28) %(log_level_short_code:<2) "
                                    "%(tags)%(message)",
                                    "%Y-%m-%d %H:%M:%S.%Qms",
                                    quill::Timezone::GmtTime } );
  return logger;
}

std::optional< quill::LogLevel > level_from_string( std::string_view level ) noexcept
{
  constexpr std::array< std::pair< std::string_view, quill::LogLevel >, 7 > levels{
    { { "trace", quill::LogLevel::TraceL1 },
     { "debug", quill::LogLevel::Debug },
     { "info", quill::LogLevel::Info },
     { "notice", quill::LogLevel::Notice },
     { "warning", quill::LogLevel::Warning },
     { "error", quill::LogLevel::Error },
     { "critical", quill::LogLevel::Critical } }
  };

  for( const auto& [ name, value ]: levels )
    if( name == level )
      return value;

  return std::nullopt;
}

} // namespace lumen::log
