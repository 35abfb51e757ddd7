#pragma once

#include "lowrank_core/arena.hpp"
#include "lowrank_core/config.hpp"
#include "lowrank_core/eigen.hpp"
#include "lowrank_core/error.hpp"
#include "lowrank_core/image.hpp"
#include "lowrank_core/matrix.hpp"
#include "lowrank_core/pipeline.hpp"
#include "lowrank_core/progress.hpp"
#include "lowrank_core/random.hpp"
#include "lowrank_core/reconstruct.hpp"
#include "lowrank_core/slab.hpp"
#include "lowrank_core/svd.hpp"
#include "lowrank_core/workspace.hpp"
#include "lowrank_core/writer.hpp"
