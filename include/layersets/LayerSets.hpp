#pragma once

#include <layersets/capacity/CapacityGuard.hpp>
#include <layersets/capacity/TokenBucketRateLimiter.hpp>
#include <layersets/config/LayerSetsOptions.hpp>
#include <layersets/core/Error.hpp>
#include <layersets/core/TimeUtils.hpp>
#include <layersets/log/TaggedLogger.hpp>
#include <layersets/model/LayerDocument.hpp>
#include <layersets/model/LayerJson.hpp>
#include <layersets/model/LayerSetRevision.hpp>
#include <layersets/service/ImageIdentityResolver.hpp>
#include <layersets/service/LayerSetService.hpp>
#include <layersets/storage/RevisionStore.hpp>
#include <layersets/validation/LayerValidator.hpp>
#include <layersets/validation/Sanitizers.hpp>
#include <layersets/validation/ValidationResult.hpp>
