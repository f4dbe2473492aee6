#pragma once

// cmd_classify: print the canonical classification of every wardrobe record.
// Usage: stylegate_cli classify --wardrobe <file>
int cmd_classify(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
