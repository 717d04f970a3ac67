#pragma once

#include "arcwalk/config.hpp"
#include "arcwalk/constants.hpp"
#include "arcwalk/digest.hpp"
#include "arcwalk/env.hpp"
#include "arcwalk/errors.hpp"
#include "arcwalk/executor.hpp"
#include "arcwalk/external_tool.hpp"
#include "arcwalk/list_file.hpp"
#include "arcwalk/log.hpp"
#include "arcwalk/manifest.hpp"
#include "arcwalk/native_zip.hpp"
#include "arcwalk/path_matcher.hpp"
#include "arcwalk/process.hpp"
#include "arcwalk/progress.hpp"
#include "arcwalk/strategy.hpp"
#include "arcwalk/system_info.hpp"
#include "arcwalk/tool_locator.hpp"
#include "arcwalk/tree_walker.hpp"
#include "arcwalk/zip_reader.hpp"
#include "arcwalk/zip_writer.hpp"
