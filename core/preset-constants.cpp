
#include "preset-constants.h"

#include <map>

namespace dmlgeom {

static const struct {
    const char *name;
    const char *definition;
} PRESET_CONSTANTS[] = {
    { "3cd4", "16200000.0" }, // 3/4 of a circle
    { "3cd8", "8100000.0" }, // 3/8 of a circle
    { "5cd8", "13500000.0" }, // 5/8 of a circle
    { "7cd8", "18900000.0" }, // 7/8 of a circle
    { "cd2", "10800000.0" }, // 1/2 of a circle
    { "cd4", "5400000.0" }, // 1/4 of a circle
    { "cd8", "2700000.0" }, // 1/8 of a circle
    { "t", "0" }, // top edge
    { "b", "val h" }, // bottom edge
    { "vc", "*/ h 1.0 2.0" }, // vertical center
    { "hd2", "*/ h 1.0 2.0" },
    { "hd3", "*/ h 1.0 3.0" },
    { "hd4", "*/ h 1.0 4.0" },
    { "hd5", "*/ h 1.0 5.0" },
    { "hd6", "*/ h 1.0 6.0" },
    { "hd8", "*/ h 1.0 8.0" },
    { "l", "0" }, // left edge
    { "r", "val w" }, // right edge
    { "hc", "*/ w 1.0 2.0" }, // horizontal center
    { "wd2", "*/ w 1.0 2.0" },
    { "wd3", "*/ w 1.0 3.0" },
    { "wd4", "*/ w 1.0 4.0" },
    { "wd5", "*/ w 1.0 5.0" },
    { "wd6", "*/ w 1.0 6.0" },
    { "wd8", "*/ w 1.0 8.0" },
    { "wd10", "*/ w 1.0 10.0" },
    { "ls", "max w h" }, // longest side
    { "ss", "min w h" }, // shortest side
    { "ssd2", "*/ ss 1.0 2.0" },
    { "ssd4", "*/ ss 1.0 4.0" },
    { "ssd6", "*/ ss 1.0 6.0" },
    { "ssd8", "*/ ss 1.0 8.0" },
    { "ssd16", "*/ ss 1.0 16.0" },
    { "ssd32", "*/ ss 1.0 32.0" }
};

#define PRESET_CONSTANT_COUNT (sizeof(PRESET_CONSTANTS)/sizeof(*PRESET_CONSTANTS))

static std::map<std::string, Expression> parsePresetConstants() {
    std::map<std::string, Expression> table;
    for (size_t i = 0; i < PRESET_CONSTANT_COUNT; ++i)
        table[PRESET_CONSTANTS[i].name] = Expression::parse(PRESET_CONSTANTS[i].definition);
    return table;
}

const Expression *findPresetConstant(const std::string &name) {
    static const std::map<std::string, Expression> table = parsePresetConstants();
    std::map<std::string, Expression>::const_iterator it = table.find(name);
    if (it == table.end())
        return NULL;
    return &it->second;
}

const char *presetConstantDefinition(const std::string &name) {
    for (size_t i = 0; i < PRESET_CONSTANT_COUNT; ++i) {
        if (name == PRESET_CONSTANTS[i].name)
            return PRESET_CONSTANTS[i].definition;
    }
    return NULL;
}

}
