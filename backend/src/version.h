#pragma once
// ─── FrameRelay — Version ───────────────────────────────────────────────

#define FRAMERELAY_VERSION "1.0.0"
