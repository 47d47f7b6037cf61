#include <cctype>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "app/connection_facade.hpp"
#include "conn/connection_engine.hpp"
#include "ctl/ipc.hpp"
#include "discovery/discovery_engine.hpp"
#include "host/radio_host.hpp"
#include "host/service_lifecycle.hpp"
#include "proto/command.hpp"
#include "proto/sessions.hpp"
#include "transport/bluez_radio.hpp"
#include "transport/fake_radio.hpp"
#include "util/config.hpp"
#include "util/executor.hpp"
#include "util/log.hpp"

namespace
{

app::ConnectionFacade      *g_facade    = nullptr;
discovery::DiscoveryEngine *g_discovery = nullptr;
util::Config                g_cfg;

// CONNECT blocks the control client at most this long, then the attempt is cancelled
constexpr std::chrono::milliseconds kConnectDeadline{10000};

// in-flight session.stream transfer, fed from status notifications
std::mutex                             g_dl_mu;
std::optional<proto::SessionDownload>  g_download;

// ---------------- helpers ----------------
static bool is_valid_mac(const std::string &mac)
{
    if (mac.size() != 17)
        return false;
    for (size_t i = 0; i < mac.size(); ++i)
    {
        if ((i % 3) == 2)
        {
            if (mac[i] != ':')
                return false;
        }
        else
        {
            unsigned char c = static_cast<unsigned char>(mac[i]);
            if (!std::isxdigit(c))
                return false;
        }
    }
    return true;
}

static std::string normalize_mac(std::string mac)
{
    for (auto &c : mac)
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return mac;
}

static std::vector<std::string> split_words(const std::string &line)
{
    std::istringstream       iss(line);
    std::vector<std::string> out;
    std::string              w;
    while (iss >> w)
        out.push_back(w);
    return out;
}

std::unique_ptr<transport::IRadio> make_radio(const util::Config &cfg)
{
    if (cfg.radio == util::RadioKind::Fake)
    {
        transport::FakeRadio::Options opts;
        opts.advertise    = {{"AA:BB:CC:DD:EE:01", std::string("Liftrr Sensor"), -55},
                             {"AA:BB:CC:DD:EE:02", std::nullopt, -90}};
        opts.auto_connect = true;
        opts.echo_writes  = true;
        return std::make_unique<transport::FakeRadio>(std::move(opts));
    }
    transport::BluezConfig bc;
    bc.adapter = cfg.adapter;
    return std::make_unique<transport::BluezRadio>(std::move(bc));
}

static bool save_download(const proto::SessionDownload &dl)
{
    namespace fs = std::filesystem;
    std::error_code ec;
    fs::create_directories(g_cfg.download_dir, ec);
    if (ec)
    {
        LOG_ERROR("[SESSION] create_directories(%s) failed: %s", g_cfg.download_dir.c_str(),
                  ec.message().c_str());
        return false;
    }
    // session ids come from the device; keep them inside the download dir
    std::string name = fs::path(dl.session_id()).filename().string();
    if (name.empty() || name == "." || name == "..")
        name = "session.bin";
    const fs::path out = fs::path(g_cfg.download_dir) / name;

    std::ofstream ofs(out, std::ios::binary | std::ios::trunc);
    ofs.write(reinterpret_cast<const char *>(dl.bytes().data()),
              static_cast<std::streamsize>(dl.bytes().size()));
    if (!ofs)
    {
        LOG_ERROR("[SESSION] write %s failed", out.string().c_str());
        return false;
    }
    LOG_SYSTEM("[SESSION] saved %s (%zu bytes)", out.string().c_str(), dl.bytes().size());
    return true;
}

static void on_status_event(const proto::StatusEvent &ev)
{
    LOG_SYSTEM("[STATUS] %s", proto::describe(ev).c_str());

    if (auto page = proto::parse_sessions_list(ev))
    {
        for (const auto &it : page->items)
            LOG_SYSTEM("[SESSIONS] %s lift=%s size=%lld mtime=%lld", it.file_name.c_str(),
                       it.lift_name().c_str(), (long long)it.size, (long long)it.mtime);
        if (page->next)
            LOG_SYSTEM("[SESSIONS] more from cursor %lld", (long long)*page->next);
        return;
    }

    auto chunk = proto::parse_session_chunk(ev);
    if (!chunk)
        return;
    std::lock_guard<std::mutex> lk(g_dl_mu);
    if (!g_download)
    {
        LOG_DEBUG("[SESSION] chunk for %s without a transfer", chunk->session_id.c_str());
        return;
    }
    switch (g_download->feed(*chunk))
    {
        case proto::SessionDownload::Feed::Accepted:
            break;
        case proto::SessionDownload::Feed::Complete:
            (void)save_download(*g_download);
            g_download.reset();
            break;
        case proto::SessionDownload::Feed::Rejected:
            LOG_WARN("[SESSION] chunk rejected (id=%s offset=%llu)", chunk->session_id.c_str(),
                     (unsigned long long)chunk->offset);
            break;
    }
}

static std::string status_reply()
{
    std::ostringstream os;
    const auto         scan  = g_facade->scan_state().value();
    const auto         state = g_facade->connection_state().value();
    os << "service=" << (g_facade->is_service_running().value() ? "running" : "stopped")
       << " scan=" << discovery::state_name(scan) << "(" << discovery::devices_of(scan).size()
       << ") conn=" << conn::state_name(state);
    if (const auto *c = std::get_if<conn::ConnConnected>(&state))
        os << " device=" << c->device.address;
    if (const auto *e = std::get_if<conn::ConnError>(&state))
        os << " error=\"" << e->message << "\"";
    if (const auto *e = std::get_if<discovery::ScanError>(&scan))
        os << " scan_error=\"" << e->message << "\"";
    {
        std::lock_guard<std::mutex> lk(g_dl_mu);
        if (g_download)
            os << " download=" << g_download->session_id() << "(" << g_download->bytes().size()
               << ")";
    }
    os << "\n";
    return os.str();
}

static std::string devices_reply()
{
    std::ostringstream os;
    for (const auto &d : discovery::devices_of(g_facade->scan_state().value()))
        os << d.address << " rssi=" << d.rssi << " name=" << d.name << "\n";
    if (os.tellp() == 0)
        return "no devices\n";
    return os.str();
}

static std::string do_connect(const std::string &mac_in)
{
    const std::string mac = normalize_mac(mac_in);
    if (!is_valid_mac(mac))
    {
        LOG_WARN("[CONNECT] invalid MAC address: %s", mac_in.c_str());
        return "error: invalid MAC address\n";
    }
    auto dev = g_discovery->find(mac);
    if (!dev)
    {
        LOG_WARN("[CONNECT] %s not in the scan results", mac.c_str());
        return "error: device not discovered, run scan first\n";
    }
    const auto res = g_facade->connect_within(*dev, kConnectDeadline);
    if (res.ok())
        LOG_SYSTEM("[CONNECT] connected to %s", mac.c_str());
    else
        LOG_SYSTEM("[CONNECT] %s: %s", conn::status_name(res.status), res.message.c_str());
    return std::string(res.ok() ? "ok" : conn::status_name(res.status)) +
           (res.message.empty() ? "" : ": " + res.message) + "\n";
}

static std::string do_cmd(const std::vector<std::string> &words)
{
    if (words.size() < 2)
        return "error: CMD needs a command name\n";
    const std::vector<std::string> args(words.begin() + 2, words.end());
    auto                           cmd = proto::command_from_args(words[1], args);
    if (!cmd)
        return "error: unknown command or bad arguments\n";

    // armed before the write so the first chunk cannot beat it
    const bool streaming = cmd->name == "session.stream";
    if (streaming)
    {
        std::lock_guard<std::mutex> lk(g_dl_mu);
        g_download.emplace(cmd->body.value("sessionId", std::string{}));
    }
    if (!g_facade->send(*cmd))
    {
        if (streaming)
        {
            std::lock_guard<std::mutex> lk(g_dl_mu);
            g_download.reset();
        }
        LOG_WARN("[CMD] %s not sent (not connected?)", cmd->name.c_str());
        return "error: not sent\n";
    }
    LOG_INFO("[CMD] %s sent", cmd->name.c_str());
    return "ok\n";
}

static std::string on_line(const std::string &line)
{
    const auto words = split_words(line);
    if (words.empty())
        return "error: empty line\n";
    const std::string &verb = words[0];

    if (verb == "QUIT")
    {
        LOG_INFO("Received QUIT command, exiting...");
        return "bye\n";
    }
    if (verb == "UP")
        return g_facade->start_service() ? "ok\n" : "error: already running or starting\n";
    if (verb == "DOWN")
    {
        g_facade->stop_service();
        return "ok\n";
    }
    if (verb == "SCAN")
    {
        g_facade->start_scan();
        return "ok\n";
    }
    if (verb == "STOP")
    {
        g_facade->stop_scan();
        return "ok\n";
    }
    if (verb == "DEVICES")
        return devices_reply();
    if (verb == "CONNECT")
    {
        if (words.size() != 2)
            return "error: CONNECT needs an address\n";
        return do_connect(words[1]);
    }
    if (verb == "DISCONNECT")
    {
        g_facade->disconnect();
        return "ok\n";
    }
    if (verb == "STATUS")
        return status_reply();
    if (verb == "CMD")
        return do_cmd(words);

    LOG_WARN("Unknown control line: %s", line.c_str());
    return "error: unknown command\n";
}

}  // namespace

int main()
{
    g_cfg = util::Config::from_env();
    g_cfg.log();

    auto radio = make_radio(g_cfg);
    LOG_INFO("Using radio %s", radio->name().c_str());

    util::ThreadExecutor exec;
    host::RadioHost      radio_host(*radio);

    discovery::DiscoveryConfig dc;
    dc.scan_duration_ms = g_cfg.scan_ms;
    discovery::DiscoveryEngine discovery(*radio, exec, dc);
    conn::ConnectionEngine     connection(*radio, exec);
    host::ServiceLifecycle     lifecycle(radio_host, exec);
    app::ConnectionFacade      facade(discovery, connection, lifecycle);
    g_facade    = &facade;
    g_discovery = &discovery;

    facade.scan_state().subscribe([](const discovery::ScanState &s) {
        LOG_SYSTEM("[SCAN] %s devices=%zu", discovery::state_name(s),
                   discovery::devices_of(s).size());
    });
    facade.connection_state().subscribe([](const conn::ConnectionState &s) {
        LOG_SYSTEM("[CONN] %s", conn::state_name(s));
    });
    facade.is_service_running().subscribe(
        [](const bool &running) { LOG_SYSTEM("[SERVICE] running=%s", running ? "yes" : "no"); });
    facade.on_status(on_status_event);

    if (!facade.start_service())
        LOG_WARN("start_service refused");

    const bool served = ipc::start_server(g_cfg.ctl_sock, on_line);
    if (!served)
        LOG_ERROR("start_server failed");

    facade.stop_service();
    g_facade    = nullptr;
    g_discovery = nullptr;
    return served ? 0 : 1;
}
