/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */
#ifndef CONSTANTS_H
#define CONSTANTS_H

// Connection pool
#define DEFAULT_POOL_FLOOR 5
#define DEFAULT_CONNECT_TIMEOUT_MS 30000
#define DEFAULT_PROBE_TIMEOUT_MS 5000
#define DEFAULT_LEASE_TIMEOUT_MS 60000
#define DEFAULT_PROBE_PATH "/"

// Scheduler
#define DEFAULT_ITEMS_PER_WORKER 10
#define DEFAULT_MIN_WORKERS 10
#define DEFAULT_MAX_WORKERS 20
#define DEFAULT_SEQUENTIAL_THRESHOLD 5
#define DEFAULT_ITEM_TIMEOUT_MS 30000
#define DEFAULT_BATCH_TIMEOUT_MS 300000
#define DEFAULT_ITEM_ATTEMPTS 2
#define DEFAULT_PROGRESS_INTERVAL 20

// Extractor
#define DEFAULT_PREFIX_BYTES 65536
#define METERS_TO_FEET 3.28084

// Classifier / scene
#define DEFAULT_IQR_MULTIPLIER 4.0
#define DEFAULT_GROUND_OFFSET_FT 20.0
#define DEFAULT_MIN_Z_MAX_FT 100.0
#define DEFAULT_GROUND_MESH_SIZE 20
#define DEFAULT_CATEGORY "default"
#define DEFAULT_CATEGORY_COLOR "#aaaaaa"
#define DEFAULT_GROUND_COLOR "#002200"
#define DEFAULT_OUTLIER_COLOR "red"

// Folder aggregator
#define DEFAULT_FOLDER_PROBE_TIMEOUT_MS 30000
#define DEFAULT_LIST_TIMEOUT_MS 60000

// Whole site review (caller side)
#define DEFAULT_ANALYSIS_TIMEOUT_MS 900000

// How long the CLI waits for cancelled work before exiting
#define SHUTDOWN_GRACE_MS 5000

#define DJI_XMP_NAMESPACE "http://www.dji.com/drone-dji/1.0/"
#define DJI_XMP_PREFIX "drone-dji"

#endif // CONSTANTS_H
