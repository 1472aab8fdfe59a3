#pragma once

#include "engine/address_cache.hpp"
#include "engine/class_resolver.hpp"
#include "engine/field_offsets.hpp"
#include "engine/markup.hpp"
#include "engine/memory_reader.hpp"
#include "engine/object_locator.hpp"
#include "engine/pattern.hpp"
#include "engine/pattern_scanner.hpp"
#include "engine/process_backend.hpp"
#include "engine/region_catalog.hpp"
#include "engine/result.hpp"
#include "engine/scanner.hpp"
#include "engine/string_decoder.hpp"
#include "engine/structure_walker.hpp"
#include "engine/types.hpp"
#include "engine/version_probe.hpp"
