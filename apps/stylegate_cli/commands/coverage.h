#pragma once

// cmd_coverage: print the wardrobe coverage profile, including the gap sentence when
// complete outfits cannot be built.
// Usage: stylegate_cli coverage --wardrobe <file>
int cmd_coverage(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
