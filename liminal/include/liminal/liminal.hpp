#pragma once
// Liminal: conversational-quality controller
//
// A turn-by-turn self-regulation pipeline:
// - Types: Signal, Tone, StabilizerState
// - Stabilizer: hysteresis state over smoothed drift/resonance
// - Sync: residual corrections against the baselines
// - Awareness: self-observation of the two layers above
// - Compassion: suffering detection and kindness
// - Silence: pause typing and intervention policy
// - Pipeline: the enabled layers as an ordered stage list

#include "version.hpp"
#include "types.hpp"
#include "log.hpp"
#include "config.hpp"
#include "stabilizer.hpp"
#include "sync.hpp"
#include "awareness.hpp"
#include "compassion.hpp"
#include "silence.hpp"
#include "pipeline.hpp"
#include "guard.hpp"
#include "alerts.hpp"
#include "dialog.hpp"
#include "session.hpp"
