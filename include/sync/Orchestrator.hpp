#pragma once

#include "backup/BackupSet.hpp"
#include "backup/Store.hpp"
#include "sync/Catalog.hpp"
#include "sync/RunContext.hpp"
#include "sync/model/DeviceOutcome.hpp"
#include "sync/model/RunReport.hpp"
#include "transport/Session.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace rs::sync {

// Drives one run: prune, back up, download from every device, reconcile,
// publish, upload. A device failure never stops the run; filesystem errors
// on the local side do (they propagate out of run()).
class Orchestrator {
public:
    enum class Phase : uint8_t {
        Init,
        Pruned,
        BackupCreated,
        Downloading,
        Reconciling,
        Publishing,
        Uploading,
        Done
    };

    Orchestrator(RunContext ctx, transport::SessionFactory factory);

    model::RunReport run();

    [[nodiscard]] Phase phase() const { return phase_; }
    [[nodiscard]] const std::vector<model::DeviceOutcome>& outcomes() const { return outcomes_; }
    [[nodiscard]] const std::optional<backup::BackupSet>& backupSet() const { return set_; }

    static constexpr auto MANIFEST_FILE = "manifest.json";

private:
    RunContext ctx_;
    transport::SessionFactory factory_;
    backup::Store store_;
    Catalog catalog_;

    Phase phase_{Phase::Init};
    std::optional<backup::BackupSet> set_;
    std::vector<model::DeviceOutcome> outcomes_;
    std::vector<types::Winner> winners_;
    model::RunReport report_;

    void advance(Phase next);

    void prepareFolders() const;
    model::DeviceOutcome downloadFrom(const types::Device& device);
    void downloadFiles(transport::Session& session, model::DeviceOutcome& outcome);
    void uploadTo(model::DeviceOutcome& outcome, const std::vector<std::filesystem::path>& saves) const;
    [[nodiscard]] std::vector<std::filesystem::path> canonicalSaves() const;
    void writeManifest() const;
    void logSummary() const;
};

std::string to_string(Orchestrator::Phase phase);

}
