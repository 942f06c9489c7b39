#pragma once

/**
 * BoxHunt
 *
 * Collects cardboard-box images from keyword search APIs and websites,
 * drops near-duplicates and records every accepted image in a CSV store.
 */

#include <boxhunt/result.hpp>
#include <boxhunt/types.hpp>
#include <boxhunt/config.hpp>
#include <boxhunt/harvester.hpp>
#include <boxhunt/net/http_client.hpp>
#include <boxhunt/net/url.hpp>
#include <boxhunt/source/source_manager.hpp>
#include <boxhunt/source/website_crawler.hpp>
#include <boxhunt/storage/metadata_store.hpp>
#include <boxhunt/util/logger.hpp>
