#include "debugging.h"
#include "strview.h"

#include <array>
#include <cstdarg>
#include <cstdio>

#if _WIN32
# define WIN32_LEAN_AND_MEAN 1
# include <Windows.h>
#endif

namespace rpath
{
    #ifdef QUIETLOG
        static LogSeverity Filter = LogSeverityWarn;
    #else
        static LogSeverity Filter = LogSeverityInfo;
    #endif

    struct log_handler
    {
        void* context;
        LogMsgHandler handler;
    };
    static constexpr int MAX_LOG_HANDLERS = 16;
    static int NumLogHandlers;
    static std::array<log_handler, MAX_LOG_HANDLERS> LogHandlers;

    static int index_of(void* context, LogMsgHandler handler) noexcept
    {
        for (int i = 0; i < NumLogHandlers; ++i)
            if (LogHandlers[i].context == context && LogHandlers[i].handler == handler)
                return i;
        return -1;
    }

    static void remove_at(int index) noexcept
    {
        --NumLogHandlers;
        for (int i = index; i < NumLogHandlers; ++i) // keep the call order
            LogHandlers[i] = LogHandlers[i + 1];
    }

    void add_log_handler(void* context, LogMsgHandler handler) noexcept
    {
        if (NumLogHandlers < MAX_LOG_HANDLERS && index_of(context, handler) == -1)
            LogHandlers[NumLogHandlers++] = { context, handler };
    }

    void remove_log_handler(void* context, LogMsgHandler handler) noexcept
    {
        int index = index_of(context, handler);
        if (index != -1)
            remove_at(index);
    }

    // SetLogHandler() callbacks ride in the context pointer
    static void callback_proxy(void* context, LogSeverity severity, const char* message, int len)
    {
        reinterpret_cast<LogMessageCallback>(context)(severity, message, len);
    }

    void SetLogHandler(LogMessageCallback loghandler) noexcept
    {
        for (int i = 0; i < NumLogHandlers; ++i)
        {
            if (LogHandlers[i].handler == &callback_proxy)
            {
                remove_at(i);
                break;
            }
        }
        if (loghandler)
            add_log_handler(reinterpret_cast<void*>(loghandler), &callback_proxy);
    }

    void SetLogSeverityFilter(LogSeverity filter) noexcept { Filter = filter; }
    LogSeverity GetLogSeverityFilter() noexcept { return Filter; }

    // messages longer than the buffer are cut, one byte is kept for a newline
    static int format_message(char* buf, int size, const char* format, va_list ap) noexcept
    {
        int len = vsnprintf(buf, size_t(size - 1), format, ap);
        if (len < 0 || len >= size - 1)
        {
            len = size - 2;
            buf[len] = '\0';
        }
        return len;
    }

    static void write_to_console(LogSeverity severity, const char* message, int len)
    {
        #if _MSC_VER
            static bool utf8_console = SetConsoleOutputCP(CP_UTF8) != 0;
            (void)utf8_console;
        #endif

        // the whole line goes out in a single fwrite
        strview color = severity == LogSeverityWarn  ? "\x1b[93m" // bright yellow
                      : severity == LogSeverityError ? "\x1b[91m" // bright red
                      : "";
        strview reset = color.empty() ? "" : "\x1b[0m";

        std::string line;
        line.reserve(size_t(color.len + len + reset.len + 1));
        line.append(color.str, size_t(color.len));
        line.append(message, size_t(len));
        line.append(reset.str, size_t(reset.len));
        line += '\n';

        FILE* out = severity == LogSeverityError ? stderr : stdout;
        fwrite(line.data(), line.size(), 1, out);
    }

    static void log_formatted(LogSeverity severity, const char* format, va_list ap)
    {
        if (severity < Filter)
            return;

        char buf[4096];
        int len = format_message(buf, sizeof(buf), format, ap);

        if (NumLogHandlers == 0)
        {
            write_to_console(severity, buf, len);
            return;
        }
        for (int i = 0; i < NumLogHandlers; ++i)
            LogHandlers[i].handler(LogHandlers[i].context, severity, buf, len);
    }

    void _LogInfo(PRINTF_FMTSTR const char* format, ...)
    {
        va_list ap; va_start(ap, format);
        log_formatted(LogSeverityInfo, format, ap);
        va_end(ap);
    }

    void _LogWarning(PRINTF_FMTSTR const char* format, ...)
    {
        va_list ap; va_start(ap, format);
        log_formatted(LogSeverityWarn, format, ap);
        va_end(ap);
    }

    void _LogError(PRINTF_FMTSTR const char* format, ...)
    {
        va_list ap; va_start(ap, format);
        log_formatted(LogSeverityError, format, ap);
        va_end(ap);
    }

    const char* _FmtString(PRINTF_FMTSTR const char* format, ...)
    {
        static thread_local char buf[4096];
        va_list ap; va_start(ap, format);
        format_message(buf, sizeof(buf), format, ap);
        va_end(ap);
        return buf;
    }
}
