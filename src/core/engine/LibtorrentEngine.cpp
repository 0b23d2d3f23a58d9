#include "LibtorrentEngine.hpp"

#include <filesystem>
#include <utility>
#include <vector>

#include <libtorrent/add_torrent_params.hpp>
#include <libtorrent/alert_types.hpp>
#include <libtorrent/error_code.hpp>
#include <libtorrent/file_storage.hpp>
#include <libtorrent/hex.hpp>
#include <libtorrent/info_hash.hpp>
#include <libtorrent/session.hpp>
#include <libtorrent/session_params.hpp>
#include <libtorrent/settings_pack.hpp>
#include <libtorrent/torrent_handle.hpp>
#include <libtorrent/torrent_info.hpp>
#include <libtorrent/torrent_status.hpp>
#include <spdlog/spdlog.h>

#include "core/Errors.hpp"

namespace bitserve {

namespace fs = std::filesystem;

namespace {

constexpr const char* kUnknownName = "Unknown name";

class LtHandle : public EngineHandle {
public:
  explicit LtHandle(lt::torrent_handle h) : handle(std::move(h)) {}
  lt::torrent_handle handle;
};

const lt::torrent_handle& unwrap(const EngineHandle& h) {
  const auto* lh = dynamic_cast<const LtHandle*>(&h);
  if (!lh) throw EngineError("handle was not created by this engine");
  return lh->handle;
}

std::shared_ptr<lt::torrent_info> decode(std::string_view bytes) {
  lt::error_code ec;
  auto ti = std::make_shared<lt::torrent_info>(
      lt::span<const char>(bytes.data(), static_cast<long>(bytes.size())), ec, lt::from_span);
  if (ec) throw ValidationError("invalid torrent: " + ec.message());
  return ti;
}

void checkFilePaths(const lt::torrent_info& ti) {
  const auto& files = ti.files();
  for (auto i : files.file_range()) {
    const std::string p = files.file_path(i);
    if (escapesSavePath(p)) throw ValidationError("torrent path escapes its save path: " + p);
  }
}

const char* stateName(lt::torrent_status::state_t s) {
  switch (s) {
    case lt::torrent_status::checking_files:        return "checking_files";
    case lt::torrent_status::downloading_metadata:  return "downloading_metadata";
    case lt::torrent_status::downloading:           return "downloading";
    case lt::torrent_status::finished:              return "finished";
    case lt::torrent_status::seeding:               return "seeding";
    case lt::torrent_status::checking_resume_data:  return "checking_resume_data";
    default:                                        return "unknown";
  }
}

lt::settings_pack basePack(const std::string& listenInterfaces) {
  lt::settings_pack pack;
  pack.set_str(lt::settings_pack::listen_interfaces, listenInterfaces);
  pack.set_int(lt::settings_pack::alert_mask,
               lt::alert_category::error | lt::alert_category::storage);
  return pack;
}

} // namespace

bool escapesSavePath(const std::string& relativePath) {
  const fs::path p(relativePath);
  if (p.empty() || p.is_absolute() || p.has_root_name() || p.has_root_directory()) return true;
  for (const auto& part : p) {
    if (part == "..") return true;
  }
  return false;
}

LibtorrentEngine::LibtorrentEngine(Options options) : options_(std::move(options)) {
  fs::create_directories(options_.download_root);
}

LibtorrentEngine::~LibtorrentEngine() = default;

void LibtorrentEngine::open() {
  std::lock_guard<std::mutex> lk(mutex_);
  if (session_) return;
  lt::session_params params(basePack(options_.listen_interfaces));
  session_ = std::make_unique<lt::session>(std::move(params));
  spdlog::info("libtorrent session listening on {}", options_.listen_interfaces);
}

void LibtorrentEngine::close() {
  std::lock_guard<std::mutex> lk(mutex_);
  session_.reset();
}

lt::session& LibtorrentEngine::session() const {
  if (!session_) throw EngineError("engine is not open");
  return *session_;
}

std::string LibtorrentEngine::confine(const std::string& destination) const {
  const fs::path root = fs::weakly_canonical(options_.download_root);
  const fs::path dest = fs::weakly_canonical(destination);
  const fs::path rel = dest.lexically_relative(root);
  if (rel.empty() || *rel.begin() == "..") {
    throw EngineError("destination " + dest.string() + " is outside " + root.string());
  }
  return dest.string();
}

DescriptorInfo LibtorrentEngine::parse(std::string_view bytes) const {
  auto ti = decode(bytes);
  checkFilePaths(*ti);
  DescriptorInfo info;
  info.id = lt::aux::to_hex(ti->info_hashes().get_best().to_string());
  info.name = ti->name().empty() ? kUnknownName : ti->name();
  return info;
}

std::unique_ptr<EngineHandle> LibtorrentEngine::load(std::string_view bytes,
                                                     const std::string& destination) {
  std::shared_ptr<lt::torrent_info> ti;
  try {
    ti = decode(bytes);
    checkFilePaths(*ti);
  } catch (const ValidationError& e) {
    throw EngineError(e.what());
  }

  lt::add_torrent_params params;
  params.ti = std::move(ti);
  params.save_path = confine(destination);

  std::lock_guard<std::mutex> lk(mutex_);
  lt::error_code ec;
  lt::torrent_handle h = session().add_torrent(std::move(params), ec);
  if (ec) throw EngineError("add_torrent failed: " + ec.message());
  return std::make_unique<LtHandle>(std::move(h));
}

StatusSnapshot LibtorrentEngine::status(const EngineHandle& handle) const {
  const auto& h = unwrap(handle);
  if (!h.is_valid()) throw EngineError("torrent handle is no longer valid");

  lt::torrent_status st;
  try {
    st = h.status();
  } catch (const lt::system_error& e) {
    throw EngineError(std::string("status failed: ") + e.what());
  }

  StatusSnapshot s;
  s.name              = st.name;
  s.progress_fraction = st.progress;
  s.download_rate     = st.download_rate;
  s.upload_rate       = st.upload_rate;
  s.state             = stateName(st.state);
  s.seed_time         = st.seeding_duration.count();
  s.peer_count        = st.num_peers;
  s.bytes_uploaded    = st.all_time_upload;
  s.bytes_downloaded  = st.all_time_download;
  return s;
}

void LibtorrentEngine::unload(EngineHandle& handle, bool deleteFiles) {
  const auto& h = unwrap(handle);
  std::lock_guard<std::mutex> lk(mutex_);
  try {
    lt::remove_flags_t flags = {};
    if (deleteFiles) flags = lt::session::delete_files;
    session().remove_torrent(h, flags);
  } catch (const lt::system_error& e) {
    throw EngineError(std::string("remove_torrent failed: ") + e.what());
  }
}

std::string LibtorrentEngine::saveSession() {
  std::lock_guard<std::mutex> lk(mutex_);
  try {
    const lt::session_params state = session().session_state();
    const std::vector<char> buf = lt::write_session_params_buf(state);
    return std::string(buf.begin(), buf.end());
  } catch (const lt::system_error& e) {
    throw EngineError(std::string("saving session state failed: ") + e.what());
  }
}

void LibtorrentEngine::restoreSession(std::string_view blob) {
  lt::session_params params;
  try {
    params = lt::read_session_params(
        lt::span<const char>(blob.data(), static_cast<long>(blob.size())));
  } catch (const lt::system_error& e) {
    throw EngineError(std::string("session state is unreadable: ") + e.what());
  }
  // configured listen interfaces win over the stored ones
  params.settings.set_str(lt::settings_pack::listen_interfaces, options_.listen_interfaces);

  std::lock_guard<std::mutex> lk(mutex_);
  if (!session_ || session_->get_torrents().empty()) {
    // nothing loaded yet: rebuild so DHT state comes back too
    session_.reset();
    session_ = std::make_unique<lt::session>(std::move(params));
    return;
  }
  session_->apply_settings(std::move(params.settings));
}

} // namespace bitserve
