#pragma once

// cmd_evaluate: rank candidate outfit drafts against a wardrobe and ground the best ones.
// Usage: stylegate_cli evaluate --wardrobe <file> --drafts <file> [--preferences <file>]
//                               [--config <file>] [--climate hot|mild|cold]
//                               [--formality casual|smart-casual|smart|formal]
//                               [--mode visual_outfit|advisory_text|shopping_comparison|mixed]
//                               [--strictness relaxed|normal|strict] [--top-n N]
//                               [--aesthetics a,b] [--db <file>] [--show-audit]
// Flags override the values loaded from --config. With --db the audit trail is persisted
// to SQLite; otherwise it is kept in memory.
int cmd_evaluate(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
