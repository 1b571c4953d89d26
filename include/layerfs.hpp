#pragma once

#include "layerfs/cli.hpp"
#include "layerfs/config.hpp"
#include "layerfs/directory_entry.hpp"
#include "layerfs/directory_iterator.hpp"
#include "layerfs/error.hpp"
#include "layerfs/fs.hpp"
#include "layerfs/layer.hpp"
#include "layerfs/lifecycle.hpp"
#include "layerfs/overlay.hpp"
#include "layerfs/process.hpp"
#include "layerfs/publication.hpp"
#include "layerfs/session.hpp"
