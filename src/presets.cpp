#include "passgen/presets.hpp"

namespace passgen {

namespace {

const std::vector<std::string>& WordTokens() {
    static const std::vector<std::string> words = {
        "able",
        "acid",
        "acorn",
        "actor",
        "adapt",
        "admit",
        "adult",
        "affair",
        "agent",
        "agree",
        "ahead",
        "aisle",
        "alarm",
        "album",
        "alert",
        "alien",
        "alley",
        "almond",
        "alpine",
        "amber",
        "ample",
        "anchor",
        "angle",
        "ankle",
        "annual",
        "anvil",
        "apple",
        "apron",
        "arch",
        "arena",
        "argue",
        "armor",
        "army",
        "arrow",
        "artist",
        "ashore",
        "aspen",
        "atlas",
        "atom",
        "attic",
        "audio",
        "august",
        "aunt",
        "autumn",
        "avenue",
        "avocado",
        "awake",
        "award",
        "axis",
        "bacon",
        "badge",
        "bagel",
        "baker",
        "balcony",
        "ballot",
        "bamboo",
        "banana",
        "banjo",
        "banner",
        "barley",
        "barn",
        "barrel",
        "basin",
        "basket",
        "batch",
        "beach",
        "beacon",
        "beard",
        "beaver",
        "bedrock",
        "beetle",
        "begin",
        "bench",
        "berry",
        "bicycle",
        "bingo",
        "birch",
        "biscuit",
        "bison",
        "blade",
        "blanket",
        "blazer",
        "blend",
        "blossom",
        "blue",
        "board",
        "bonfire",
        "bonus",
        "border",
        "bottle",
        "boulder",
        "bounce",
        "bracket",
        "brain",
        "branch",
        "brave",
        "bread",
        "breeze",
        "brick",
        "bridge",
        "brief",
        "bright",
        "broom",
        "brush",
        "bubble",
        "bucket",
        "budget",
        "buffalo",
        "bugle",
        "bundle",
        "burrow",
        "butter",
        "button",
        "buzzer",
        "cabin",
        "cable",
        "cactus",
        "camel",
        "camera",
        "canal",
        "candle",
        "canoe",
        "canvas",
        "canyon",
        "captain",
        "carbon",
        "cargo",
        "carpet",
        "carrot",
        "castle",
        "cattle",
        "cedar",
        "cellar",
        "census",
        "cereal",
        "chalk",
        "channel",
        "chapel",
        "charcoal",
        "cheese",
        "cherry",
        "chess",
        "chimney",
        "chorus",
        "cider",
        "cinema",
        "circus",
        "citrus",
        "clam",
        "clerk",
        "cliff",
        "climate",
        "clock",
        "cloud",
        "clover",
        "cobalt",
        "cocoa",
        "coconut",
        "comet",
        "compass",
        "copper",
        "coral",
        "cotton",
        "cougar",
        "county",
        "cousin",
        "coyote",
        "cradle",
        "crane",
        "crater",
        "crayon",
        "cricket",
        "crystal",
        "cube",
        "cupboard",
        "curtain",
        "cushion",
        "cycle",
        "cypress",
        "daisy",
        "dance",
        "dancer",
        "debate",
        "decade",
        "decoy",
        "delta",
        "denim",
        "desert",
        "desk",
        "detail",
        "device",
        "dial",
        "diamond",
        "diary",
        "diesel",
        "dinner",
        "dragon",
        "drama",
        "drawer",
        "dream",
        "drift",
        "drum",
        "duck",
        "dune",
        "dusk",
        "dynamo",
        "eagle",
        "early",
        "earth",
        "easel",
        "echo",
        "eclipse",
        "edge",
        "eel",
        "effort",
        "elbow",
        "elder",
        "element",
        "elephant",
        "elk",
        "ember",
        "emerald",
        "empire",
        "engine",
        "enjoy",
        "entry",
        "envelope",
        "epoch",
        "equal",
        "escape",
        "estate",
        "evening",
        "ever",
        "exile",
        "exit",
        "expert",
        "fable",
        "fabric",
        "falcon",
        "fancy",
        "farm",
        "fashion",
        "feather",
        "fence",
        "ferry",
        "fiber",
        "fiction",
        "field",
        "fig",
        "filter",
        "finch",
        "fiscal",
        "flag",
        "flame",
        "flannel",
        "flask",
        "fleet",
        "flint",
        "flock",
        "floor",
        "flute",
        "focus",
        "fog",
        "folder",
        "forest",
        "fossil",
        "fountain",
        "fox",
        "frame",
        "freckle",
        "freight",
        "frost",
        "fruit",
        "funnel",
        "gadget",
        "galaxy",
        "gallon",
        "garage",
        "garden",
        "garlic",
        "garnet",
        "gate",
        "gazelle",
        "gecko",
        "gentle",
        "giant",
        "ginger",
        "giraffe",
        "glacier",
        "glad",
        "glimpse",
        "globe",
        "glove",
        "goat",
        "goblet",
        "golden",
        "gondola",
        "gopher",
        "gorilla",
        "gospel",
        "gravel",
        "gravy",
        "grid",
        "grove",
        "guitar",
        "gutter",
        "habit",
        "hammer",
        "hamster",
        "harbor",
        "harvest",
        "hatch",
        "haven",
        "hazel",
        "helmet",
        "herb",
        "heron",
        "hickory",
        "hockey",
        "holiday",
        "honey",
        "hoodie",
        "horizon",
        "hornet",
        "hotel",
        "humble",
        "hunter",
        "hurdle",
        "husky",
        "hybrid",
        "ice",
        "icon",
        "igloo",
        "image",
        "immune",
        "index",
        "indigo",
        "infant",
        "inlet",
        "insect",
        "island",
        "ivory",
        "jacket",
        "jaguar",
        "jargon",
        "jasmine",
        "javelin",
        "jelly",
        "jester",
        "jewel",
        "jigsaw",
        "jockey",
        "journal",
        "journey",
        "jovial",
        "judge",
        "juggle",
        "juice",
        "jungle",
        "junior",
        "jury",
        "kayak",
        "kelp",
        "kennel",
        "kernel",
        "kettle",
        "keynote",
        "kidney",
        "kingdom",
        "kiosk",
        "kite",
        "kitten",
        "kiwi",
        "knack",
        "knee",
        "knot",
        "koala",
        "label",
        "ladder",
        "lagoon",
        "lake",
        "lamp",
        "lantern",
        "laptop",
        "latch",
        "lava",
        "lawn",
        "layer",
        "leader",
        "lemon",
        "lentil",
        "leopard",
        "letter",
        "lettuce",
        "lever",
        "library",
        "lilac",
        "lily",
        "limb",
        "linen",
        "lion",
        "liquid",
        "lizard",
        "lobster",
        "locket",
        "lodge",
        "logic",
        "lotus",
        "lumber",
        "lunar",
        "lunch",
        "magnet",
        "mango",
        "mantle",
        "maple",
        "marble",
        "margin",
        "marsh",
        "mask",
        "meadow",
        "medal",
        "melody",
        "melon",
        "memory",
        "mentor",
        "meteor",
        "method",
        "metro",
        "midnight",
        "mineral",
        "minnow",
        "mirror",
        "mitten",
        "mobile",
        "monarch",
        "monkey",
        "moose",
        "mosaic",
        "moss",
        "motel",
        "mountain",
        "muffin",
        "mural",
        "museum",
        "mustard",
        "napkin",
        "narrow",
        "native",
        "nature",
        "nectar",
        "needle",
        "nephew",
        "nest",
        "nickel",
        "night",
        "noble",
        "nomad",
        "noodle",
        "north",
        "notebook",
        "novel",
        "nugget",
        "nutmeg",
        "oak",
        "oasis",
        "oat",
        "ocean",
        "octave",
        "olive",
        "omega",
        "onion",
        "opera",
        "orange",
        "orbit",
        "orchard",
        "orchid",
        "organ",
        "ostrich",
        "otter",
        "outpost",
        "oven",
        "owl",
        "oxygen",
        "oyster",
        "paddle",
        "pagoda",
        "palace",
        "palm",
        "panda",
        "panther",
        "paper",
        "parade",
        "parcel",
        "parrot",
        "pasta",
        "pastel",
        "patio",
        "peach",
        "peanut",
        "pearl",
        "pebble",
        "pelican",
        "pencil",
        "penguin",
        "pepper",
        "piano",
        "pickle",
        "pigeon",
        "pillow",
        "pilot",
        "pine",
        "pirate",
        "pistachio",
        "planet",
        "plaza",
        "plum",
        "pocket",
        "poem",
        "polar",
        "pollen",
        "pond",
        "poppy",
        "portal",
        "potato",
        "pottery",
        "prairie",
        "prism",
        "pulse",
        "pumpkin",
        "puppet",
        "puzzle",
        "pyramid",
        "quail",
        "quarry",
        "quartz",
        "quest",
        "quiet",
        "quill",
        "quilt",
        "quiver",
        "quota",
        "rabbit",
        "raccoon",
        "radar",
        "radish",
        "raft",
        "rain",
        "raisin",
        "ranch",
        "raven",
        "razor",
        "recipe",
        "reef",
        "relic",
        "rescue",
        "ribbon",
        "riddle",
        "ridge",
        "rival",
        "river",
        "robin",
        "rocket",
        "rodeo",
        "roof",
        "rooster",
        "rose",
        "rubber",
        "ruby",
        "rudder",
        "rumble",
        "runway",
        "rustic",
        "saddle",
        "saffron",
        "sail",
        "salad",
        "salmon",
        "sand",
        "sapphire",
        "satin",
        "saucer",
        "savanna",
        "scarf",
        "school",
        "scooter",
        "scroll",
        "season",
        "seed",
        "sequel",
        "shadow",
        "shelf",
        "shell",
        "shield",
        "shovel",
        "shrimp",
        "sierra",
        "signal",
        "silk",
        "silver",
        "siren",
        "sketch",
        "skillet",
        "sleet",
        "slope",
        "sloth",
        "smoke",
        "snack",
        "snail",
        "sofa",
        "solar",
        "sonnet",
        "spark",
        "sparrow",
        "spice",
        "spider",
        "spiral",
        "sponge",
        "spruce",
        "squash",
        "squirrel",
        "stable",
        "stadium",
        "stairs",
        "statue",
        "steam",
        "stone",
        "storm",
        "straw",
        "stream",
        "studio",
        "summit",
        "sunset",
        "swamp",
        "swan",
        "sweater",
        "syrup",
        "table",
        "tablet",
        "tackle",
        "tadpole",
        "talon",
        "tango",
        "tapestry",
        "target",
        "tavern",
        "teapot",
        "temple",
        "tennis",
        "tent",
        "thicket",
        "thimble",
        "thistle",
        "thunder",
        "ticket",
        "tiger",
        "timber",
        "toast",
        "tomato",
        "tonic",
        "topaz",
        "torch",
        "tortoise",
        "totem",
        "tower",
        "tractor",
        "trail",
        "tram",
        "treaty",
        "trellis",
        "trophy",
        "trumpet",
        "tulip",
        "tundra",
        "tunnel",
        "turkey",
        "turnip",
        "turtle",
        "tuxedo",
        "twig",
        "umber",
        "umbrella",
        "uncle",
        "unicorn",
        "union",
        "unit",
        "upland",
        "urban",
        "urchin",
        "utensil",
        "valley",
        "valve",
        "vanilla",
        "vapor",
        "vault",
        "velvet",
        "vendor",
        "venture",
        "verse",
        "vessel",
        "vest",
        "village",
        "vine",
        "violet",
        "violin",
        "visor",
        "vivid",
        "volcano",
        "voyage",
        "vulture",
        "wafer",
        "wagon",
        "walnut",
        "walrus",
        "wander",
        "warden",
        "wasabi",
        "water",
        "wave",
        "weasel",
        "wheat",
        "whisker",
        "whistle",
        "widget",
        "willow",
        "window",
        "winter",
        "wizard",
        "wombat",
        "wonder",
        "wool",
        "workshop",
        "wreath",
        "yacht",
        "yak",
        "yard",
        "yarn",
        "year",
        "yellow",
        "yeti",
        "yodel",
        "yogurt",
        "yolk",
        "zebra",
        "zenith",
        "zephyr",
        "zero",
        "zigzag",
        "zinc",
        "zipper",
        "zodiac",
        "zone",
        "zucchini",
    };
    return words;
}

const std::vector<std::string>& AsciiTokens() {
    static const std::vector<std::string> symbols = [] {
        std::vector<std::string> out;
        out.reserve(static_cast<std::size_t>('~' - '!' + 1));
        for (char c = '!'; c <= '~'; ++c) {
            out.emplace_back(1, c);
        }
        return out;
    }();
    return symbols;
}

const std::vector<std::string>& NumberTokens() {
    static const std::vector<std::string> digits = {"0", "1", "2", "3", "4", "5", "6", "7", "8", "9"};
    return digits;
}

}  // namespace

const std::vector<Preset>& BuiltInPresets() {
    static const std::vector<Preset> presets = {
        {"word", kDefaultWordCount, " ", &WordTokens()},
        {"ascii", kDefaultAsciiCount, "", &AsciiTokens()},
        {"number", kDefaultNumberCount, "", &NumberTokens()},
    };
    return presets;
}

const Preset* FindPreset(const std::string_view name) {
    for (const auto& preset : BuiltInPresets()) {
        if (preset.name == name) {
            return &preset;
        }
    }
    return nullptr;
}

const Preset& DefaultPreset() {
    return BuiltInPresets().front();
}

TokenPool Preset::Pool() const {
    return TokenPool::FromPreset(*tokens);
}

}  // namespace passgen
