#pragma once

#include "eligix/attributes.hpp"
#include "eligix/collection.hpp"
#include "eligix/combine.hpp"
#include "eligix/crs.hpp"
#include "eligix/engine.hpp"
#include "eligix/errors.hpp"
#include "eligix/loader.hpp"
#include "eligix/predicate.hpp"
#include "eligix/preprocess.hpp"
#include "eligix/sliver.hpp"
#include "eligix/spec.hpp"
#include "eligix/types.hpp"
