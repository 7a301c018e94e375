#pragma once

#include "collector/config/config.hpp"
#include "collector/metadata/database.hpp"

namespace collector::metadata {

collector::Result<MetadataDatabasePtr> open_database(const config::MetadataConfig& config);

} // namespace collector::metadata
