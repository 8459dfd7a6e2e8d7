#pragma once

// ─── Core ────────────────────────────────────────────────────────────────────
#include "isotp/core/adapter_config.hpp"
#include "isotp/core/constants.hpp"
#include "isotp/core/error.hpp"
#include "isotp/core/frame.hpp"
#include "isotp/core/separation_time.hpp"
#include "isotp/core/types.hpp"

// ─── Utilities ───────────────────────────────────────────────────────────────
#include "isotp/util/bitfield.hpp"
#include "isotp/util/data_span.hpp"
#include "isotp/util/event.hpp"
#include "isotp/util/hex.hpp"
#include "isotp/util/state_machine.hpp"

// ─── Transport ───────────────────────────────────────────────────────────────
#include "isotp/transport/adapter.hpp"
#include "isotp/transport/padding.hpp"
#include "isotp/transport/pci.hpp"
#include "isotp/transport/session.hpp"
