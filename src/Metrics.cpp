#include <convsync/Metrics.hpp>

#include <sstream>

namespace convsync
{
    namespace
    {
        void write_metric(std::ostringstream &os,
                          const char *name,
                          const char *type,
                          const char *help,
                          std::uint64_t value)
        {
            os << "# HELP " << name << ' ' << help << "\n"
               << "# TYPE " << name << ' ' << type << "\n"
               << name << ' ' << value << "\n\n";
        }
    } // namespace

    std::string GatewayMetrics::render_prometheus() const
    {
        std::ostringstream os;

        write_metric(os, "convsync_connections_total", "counter",
                     "Total WebSocket channels accepted", connections_total.load());
        write_metric(os, "convsync_connections_active", "gauge",
                     "Currently attached WebSocket channels", connections_active.load());
        write_metric(os, "convsync_frames_in_total", "counter",
                     "Total protocol frames received", frames_in_total.load());
        write_metric(os, "convsync_frames_out_total", "counter",
                     "Total protocol frames sent", frames_out_total.load());
        write_metric(os, "convsync_frames_malformed_total", "counter",
                     "Frames dropped because they were not valid protocol JSON", frames_malformed_total.load());
        write_metric(os, "convsync_messages_persisted_total", "counter",
                     "Messages appended to the persistent store", messages_persisted_total.load());
        write_metric(os, "convsync_history_requests_total", "counter",
                     "history_request frames served", history_requests_total.load());
        write_metric(os, "convsync_sync_requests_total", "counter",
                     "sync_request frames served", sync_requests_total.load());
        write_metric(os, "convsync_http_requests_total", "counter",
                     "HTTP API requests handled", http_requests_total.load());
        write_metric(os, "convsync_errors_total", "counter",
                     "Storage or transport errors", errors_total.load());

        return os.str();
    }

} // namespace convsync
