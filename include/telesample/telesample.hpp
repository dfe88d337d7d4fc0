#pragma once

#include <telesample/config.hpp>
#include <telesample/logger.hpp>
#include <telesample/record.hpp>
#include <telesample/render_hints.hpp>
#include <telesample/sampling.hpp>

// ─── Usage ───────────────────────────────────────────────────────────────────
//
//   std::vector<telesample::Record> readings = load_readings();
//   auto shown   = telesample::adaptive_sample(readings);
//   bool markers = telesample::should_show_markers(readings.size());
//
// `shown` points into `readings`; keep the readings alive while it is used.
