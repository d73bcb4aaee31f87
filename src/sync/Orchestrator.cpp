#include "sync/Orchestrator.hpp"
#include "transport/errors.hpp"
#include "logging/LogRegistry.hpp"
#include "util/files.hpp"
#include "util/timestamp.hpp"

#include <algorithm>
#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <stdexcept>

namespace fs = std::filesystem;
using namespace rs::sync;
using namespace rs::sync::model;
using namespace rs::transport;
using namespace rs::logging;
using namespace rs::types;

namespace {

bool isSafeFilename(const std::string& name) {
    return !name.empty() && name != "." && name != ".." && name.find('/') == std::string::npos;
}

}

Orchestrator::Orchestrator(RunContext ctx, SessionFactory factory)
    : ctx_(std::move(ctx)),
      factory_(std::move(factory)),
      store_(ctx_.backup_root),
      catalog_(ctx_.devices) {
    if (!factory_) throw std::invalid_argument("Orchestrator requires a session factory");
    if (ctx_.devices.empty()) throw std::invalid_argument("Orchestrator requires at least one device");
}

RunReport Orchestrator::run() {
    if (phase_ != Phase::Init) throw std::logic_error("Orchestrator::run() may only be called once");

    report_.started_at = std::chrono::system_clock::now();

    prepareFolders();
    report_.pruned = store_.prune(ctx_.max_backups);
    advance(Phase::Pruned);

    set_.emplace(store_.createNewSet());
    report_.backup_set = set_->root();
    advance(Phase::BackupCreated);

    advance(Phase::Downloading);
    LogRegistry::retrosync()->info("~~~~~~~~ Downloading saves ~~~~~~~~");
    for (const auto& device : ctx_.devices) outcomes_.push_back(downloadFrom(device));

    advance(Phase::Reconciling);
    set_->latestDir();
    winners_ = catalog_.reconcile(*set_);
    report_.winners = winners_;

    advance(Phase::Publishing);
    Catalog::publish(*set_, winners_, ctx_.save_folder);

    advance(Phase::Uploading);
    LogRegistry::retrosync()->info("~~~~~~~~ Uploading saves back to devices ~~~~~~~~");
    const auto saves = canonicalSaves();
    for (auto& outcome : outcomes_) uploadTo(outcome, saves);

    for (const auto& outcome : outcomes_) report_.devices.push_back(DeviceSummary::from(outcome));
    report_.finished_at = std::chrono::system_clock::now();
    writeManifest();

    advance(Phase::Done);
    logSummary();
    return report_;
}

void Orchestrator::advance(const Phase next) {
    LogRegistry::retrosync()->debug("[Orchestrator] {} -> {}", to_string(phase_), to_string(next));
    phase_ = next;
}

void Orchestrator::prepareFolders() const {
    if (!fs::is_directory(ctx_.save_folder)) {
        fs::create_directories(ctx_.save_folder);
        LogRegistry::retrosync()->info("[Orchestrator] Created save folder {}", ctx_.save_folder.string());
    }
    store_.ensureRoot();
}

DeviceOutcome Orchestrator::downloadFrom(const Device& device) {
    DeviceOutcome outcome(device);
    LogRegistry::transport()->info("~~~~~~~~ Connecting to {} ~~~~~~~~", device.name());

    std::unique_ptr<Session> session;
    try {
        session = factory_(device);
        session->connect(ctx_.connect_timeout);
        session->authenticate(device.credentials());
        LogRegistry::transport()->info("~~~~~~~~ Connected to {} ~~~~~~~~", device.name());
        session->changeDirectory(device.remotePath());
    } catch (const ConnectError& e) {
        outcome.status = DeviceStatus::ConnectFailed;
        outcome.error = e.what();
        LogRegistry::transport()->error("~~~~~~~~ Failed to connect to {} ~~~~~~~~", device.name());
        LogRegistry::transport()->error("{}. Check that the device is running and that the IP and port ({}) are correct",
                                        e.what(), device.endpoint());
        return outcome;
    } catch (const AuthError& e) {
        outcome.status = DeviceStatus::AuthFailed;
        outcome.error = e.what();
        LogRegistry::transport()->error("~~~~~~~~ Failed to connect to {} ~~~~~~~~", device.name());
        LogRegistry::transport()->error("{}. Invalid username or password", e.what());
        return outcome;
    } catch (const PathError& e) {
        outcome.status = DeviceStatus::PathFailed;
        outcome.error = e.what();
        LogRegistry::transport()->error("{}. Check the path and the type of slash used", e.what());
        return outcome;
    } catch (const transport::Error& e) {
        outcome.status = DeviceStatus::TransferFailed;
        outcome.error = e.what();
        LogRegistry::transport()->error("[Orchestrator] {} failed before download: {}", device.name(), e.what());
        return outcome;
    } catch (const std::exception& e) {
        outcome.status = DeviceStatus::TransferFailed;
        outcome.error = e.what();
        LogRegistry::transport()->error("[Orchestrator] Unexpected error while opening {}: {}", device.name(), e.what());
        return outcome;
    }

    try {
        downloadFiles(*session, outcome);
    } catch (const TransferError& e) {
        outcome.status = DeviceStatus::TransferFailed;
        outcome.error = e.what();
        LogRegistry::transport()->error("[Orchestrator] Could not list saves on {}: {}", device.name(), e.what());
        return outcome;
    }

    outcome.status = DeviceStatus::Ready;
    outcome.session = std::move(session);
    return outcome;
}

void Orchestrator::downloadFiles(Session& session, DeviceOutcome& outcome) {
    const auto& name = outcome.device.name();
    const auto files = session.list();
    const auto dir = set_->deviceDir(name);

    for (const auto& file : files) {
        if (!isSafeFilename(file.name)) {
            LogRegistry::transport()->warn("[Orchestrator] Skipping unsafe file name '{}' from {}", file.name, name);
            continue;
        }

        try {
            session.download(file, dir / file.name);
        } catch (const transport::Error& e) {
            outcome.failed_downloads.push_back(file.name);
            LogRegistry::transport()->error("[Orchestrator] {}", e.what());
            continue;
        }

        catalog_.record(file.name);
        outcome.downloaded.push_back(file.name);
        LogRegistry::transport()->info("Downloaded {} ~ {}", file.name, util::timestampToString(file.modified));
    }
}

void Orchestrator::uploadTo(DeviceOutcome& outcome, const std::vector<fs::path>& saves) const {
    const auto& name = outcome.device.name();

    if (!outcome.hasRetainedSession()) {
        LogRegistry::transport()->info("[Orchestrator] Not uploading to {} ({})", name, model::to_string(outcome.status));
        return;
    }

    LogRegistry::transport()->info("~~~~~~~~ Uploading to {} ~~~~~~~~", name);
    for (const auto& save : saves) {
        const auto filename = save.filename().string();
        try {
            outcome.session->upload(save, filename);
            outcome.uploaded.push_back(filename);
            LogRegistry::transport()->debug("Uploaded {} to {}", filename, name);
        } catch (const transport::Error& e) {
            outcome.failed_uploads.push_back(filename);
            LogRegistry::transport()->error("[Orchestrator] {}", e.what());
        }
    }

    outcome.session->close();
}

std::vector<fs::path> Orchestrator::canonicalSaves() const {
    std::vector<fs::path> saves;
    for (const auto& entry : fs::directory_iterator(ctx_.save_folder))
        if (entry.is_regular_file()) saves.push_back(entry.path());

    std::sort(saves.begin(), saves.end());
    return saves;
}

void Orchestrator::writeManifest() const {
    const nlohmann::json j = report_;
    util::writeFile(set_->root() / MANIFEST_FILE, j.dump(2));
}

void Orchestrator::logSummary() const {
    const auto log = LogRegistry::retrosync();
    log->info("~~~~~~~~ Sync finished: {} save(s) reconciled into {} ~~~~~~~~", winners_.size(), set_->name());

    for (const auto& d : report_.devices) {
        if (d.status == DeviceStatus::Ready)
            log->info("[Orchestrator] {}: {} downloaded, {} uploaded{}", d.device, d.downloaded.size(), d.uploaded.size(),
                      d.failed_downloads.empty() && d.failed_uploads.empty()
                          ? ""
                          : fmt::format(" ({} download / {} upload failures)", d.failed_downloads.size(), d.failed_uploads.size()));
        else
            log->warn("[Orchestrator] {}: skipped ({})", d.device, model::to_string(d.status));
    }
}

std::string rs::sync::to_string(const Orchestrator::Phase phase) {
    switch (phase) {
    case Orchestrator::Phase::Init: return "Init";
    case Orchestrator::Phase::Pruned: return "Pruned";
    case Orchestrator::Phase::BackupCreated: return "BackupCreated";
    case Orchestrator::Phase::Downloading: return "Downloading";
    case Orchestrator::Phase::Reconciling: return "Reconciling";
    case Orchestrator::Phase::Publishing: return "Publishing";
    case Orchestrator::Phase::Uploading: return "Uploading";
    case Orchestrator::Phase::Done: return "Done";
    }
    return "Unknown";
}
