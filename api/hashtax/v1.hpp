#pragma once

#include "config/config.pb.h"

#include "internal/model/rank_summary.hpp"
#include "internal/model/sketch_record.hpp"

#include "internal/taxonomy/lca_resolver.hpp"
#include "internal/taxonomy/lineage.hpp"
#include "internal/taxonomy/taxonomy_index.hpp"

#include "internal/merge/duplicate_merger.hpp"
#include "internal/summary/rank_summarizer.hpp"

#include "internal/table/sketch_table.hpp"
#include "internal/pipeline/export_pipeline.hpp"

namespace hashtax::v1 {
using namespace ::hashtax::model;
using namespace ::hashtax::taxonomy;
using namespace ::hashtax::merge;
using namespace ::hashtax::summary;
using namespace ::hashtax::pipeline;
using ::hashtax::runtime::config::RuntimeConfig;
}
