#include "sync/RunContext.hpp"
#include "config/Config.hpp"

namespace rs::sync {

RunContext RunContext::fromConfig(const config::Config& cfg) {
    return {
        .devices = cfg.devices,
        .save_folder = cfg.paths.save_folder,
        .backup_root = cfg.paths.backup_root,
        .max_backups = cfg.backups.max_backups,
        .connect_timeout = cfg.transport.connect_timeout
    };
}

}
