#include "palette/palette_data.hpp"

namespace seasonal {

const std::vector<PaletteEntry>& builtin_palette_entries() {
    static const std::vector<PaletteEntry> entries = {
        // light_spring
        {MicroSeason::LightSpring, ColorGroup::Neutrals, "Ivory", "#FFF8E7"},
        {MicroSeason::LightSpring, ColorGroup::Neutrals, "Light Camel", "#D9B99B"},
        {MicroSeason::LightSpring, ColorGroup::Neutrals, "Warm Sand", "#E8D3B0"},
        {MicroSeason::LightSpring, ColorGroup::Neutrals, "Light Warm Gray", "#C8BFB2"},
        {MicroSeason::LightSpring, ColorGroup::Neutrals, "Peach Beige", "#F2D8C2"},
        {MicroSeason::LightSpring, ColorGroup::Accents, "Peach", "#FFCBA4"},
        {MicroSeason::LightSpring, ColorGroup::Accents, "Light Coral", "#F4978E"},
        {MicroSeason::LightSpring, ColorGroup::Accents, "Salmon Pink", "#FA8F7C"},
        {MicroSeason::LightSpring, ColorGroup::Accents, "Warm Aqua", "#7FD6C6"},
        {MicroSeason::LightSpring, ColorGroup::Accents, "Periwinkle Blue", "#9BB7E8"},
        {MicroSeason::LightSpring, ColorGroup::Brights, "Clear Coral", "#FF7F61"},
        {MicroSeason::LightSpring, ColorGroup::Brights, "Bright Lemon", "#FFE25C"},
        {MicroSeason::LightSpring, ColorGroup::Brights, "Light Turquoise", "#40E0D0"},
        {MicroSeason::LightSpring, ColorGroup::Brights, "Apple Green", "#8CD65A"},
        {MicroSeason::LightSpring, ColorGroup::Brights, "Warm Pink", "#FF8FA3"},
        {MicroSeason::LightSpring, ColorGroup::Softs, "Buttercream", "#FFF1B5"},
        {MicroSeason::LightSpring, ColorGroup::Softs, "Mint Cream", "#C9EFD9"},
        {MicroSeason::LightSpring, ColorGroup::Softs, "Blush Peach", "#F9D4C3"},
        {MicroSeason::LightSpring, ColorGroup::Softs, "Light Aqua", "#B5EAE2"},
        {MicroSeason::LightSpring, ColorGroup::Softs, "Soft Apricot", "#FBC99A"},

        // warm_spring
        {MicroSeason::WarmSpring, ColorGroup::Neutrals, "Golden Beige", "#D8B77E"},
        {MicroSeason::WarmSpring, ColorGroup::Neutrals, "Camel", "#C19A6B"},
        {MicroSeason::WarmSpring, ColorGroup::Neutrals, "Warm Ivory", "#F6EAD7"},
        {MicroSeason::WarmSpring, ColorGroup::Neutrals, "Golden Brown", "#996515"},
        {MicroSeason::WarmSpring, ColorGroup::Neutrals, "Chestnut", "#8B5A2B"},
        {MicroSeason::WarmSpring, ColorGroup::Accents, "Apricot", "#FB9E63"},
        {MicroSeason::WarmSpring, ColorGroup::Accents, "Warm Coral", "#F8766D"},
        {MicroSeason::WarmSpring, ColorGroup::Accents, "Golden Yellow", "#FFC72C"},
        {MicroSeason::WarmSpring, ColorGroup::Accents, "Warm Turquoise", "#30C6B0"},
        {MicroSeason::WarmSpring, ColorGroup::Accents, "Leaf Green", "#6DAE3C"},
        {MicroSeason::WarmSpring, ColorGroup::Brights, "Tangerine", "#FF8C1A"},
        {MicroSeason::WarmSpring, ColorGroup::Brights, "Poppy Red", "#E8422F"},
        {MicroSeason::WarmSpring, ColorGroup::Brights, "Sunflower", "#FFC512"},
        {MicroSeason::WarmSpring, ColorGroup::Brights, "Kelly Green", "#4CBB17"},
        {MicroSeason::WarmSpring, ColorGroup::Brights, "Bright Teal", "#00A693"},
        {MicroSeason::WarmSpring, ColorGroup::Softs, "Honey", "#E3B778"},
        {MicroSeason::WarmSpring, ColorGroup::Softs, "Soft Peach", "#FFD1B3"},
        {MicroSeason::WarmSpring, ColorGroup::Softs, "Warm Mint", "#A8DDB5"},
        {MicroSeason::WarmSpring, ColorGroup::Softs, "Light Goldenrod", "#F2DC8C"},
        {MicroSeason::WarmSpring, ColorGroup::Softs, "Melon", "#FDBB9F"},

        // bright_spring
        {MicroSeason::BrightSpring, ColorGroup::Neutrals, "Bright Ivory", "#FFFBF0"},
        {MicroSeason::BrightSpring, ColorGroup::Neutrals, "Warm Navy", "#24306B"},
        {MicroSeason::BrightSpring, ColorGroup::Neutrals, "Medium Camel", "#B8875A"},
        {MicroSeason::BrightSpring, ColorGroup::Neutrals, "Warm Charcoal", "#4A4340"},
        {MicroSeason::BrightSpring, ColorGroup::Neutrals, "Soft Warm Gray", "#BDB5AA"},
        {MicroSeason::BrightSpring, ColorGroup::Accents, "Hot Coral", "#FF5A5F"},
        {MicroSeason::BrightSpring, ColorGroup::Accents, "Bright Periwinkle", "#6F7FF7"},
        {MicroSeason::BrightSpring, ColorGroup::Accents, "Clear Turquoise", "#00C5CD"},
        {MicroSeason::BrightSpring, ColorGroup::Accents, "Warm Violet", "#8E5BD8"},
        {MicroSeason::BrightSpring, ColorGroup::Accents, "Bright Orange", "#FF7A1F"},
        {MicroSeason::BrightSpring, ColorGroup::Brights, "Scarlet", "#FF2400"},
        {MicroSeason::BrightSpring, ColorGroup::Brights, "Lime", "#A8E10C"},
        {MicroSeason::BrightSpring, ColorGroup::Brights, "Hot Pink", "#FF3E96"},
        {MicroSeason::BrightSpring, ColorGroup::Brights, "Cobalt Blue", "#0047AB"},
        {MicroSeason::BrightSpring, ColorGroup::Brights, "Emerald Green", "#00A86B"},
        {MicroSeason::BrightSpring, ColorGroup::Softs, "Bright Peach", "#FFB48C"},
        {MicroSeason::BrightSpring, ColorGroup::Softs, "Clear Aqua", "#7DE3E8"},
        {MicroSeason::BrightSpring, ColorGroup::Softs, "Light Lime", "#D4F28A"},
        {MicroSeason::BrightSpring, ColorGroup::Softs, "Warm Lavender", "#B9A3F0"},
        {MicroSeason::BrightSpring, ColorGroup::Softs, "Clear Pink", "#FFA6C9"},

        // soft_summer
        {MicroSeason::SoftSummer, ColorGroup::Neutrals, "Soft Taupe", "#A69C93"},
        {MicroSeason::SoftSummer, ColorGroup::Neutrals, "Grayed Navy", "#4C5B70"},
        {MicroSeason::SoftSummer, ColorGroup::Neutrals, "Mushroom", "#BDB3A6"},
        {MicroSeason::SoftSummer, ColorGroup::Neutrals, "Rose Brown", "#8F706D"},
        {MicroSeason::SoftSummer, ColorGroup::Neutrals, "Pewter", "#8E9196"},
        {MicroSeason::SoftSummer, ColorGroup::Accents, "Dusty Rose", "#C4989B"},
        {MicroSeason::SoftSummer, ColorGroup::Accents, "Slate Blue", "#6E7F99"},
        {MicroSeason::SoftSummer, ColorGroup::Accents, "Sage Teal", "#7A9E98"},
        {MicroSeason::SoftSummer, ColorGroup::Accents, "Soft Plum", "#8C6C86"},
        {MicroSeason::SoftSummer, ColorGroup::Accents, "Muted Raspberry", "#A8627A"},
        {MicroSeason::SoftSummer, ColorGroup::Brights, "Raspberry", "#B0416B"},
        {MicroSeason::SoftSummer, ColorGroup::Brights, "Soft Teal", "#3F8C8C"},
        {MicroSeason::SoftSummer, ColorGroup::Brights, "Muted Blue", "#5B7DB1"},
        {MicroSeason::SoftSummer, ColorGroup::Brights, "Soft Fuchsia", "#B55F9C"},
        {MicroSeason::SoftSummer, ColorGroup::Brights, "Spruce", "#4C7A6B"},
        {MicroSeason::SoftSummer, ColorGroup::Softs, "Dove Gray", "#B7B3B0"},
        {MicroSeason::SoftSummer, ColorGroup::Softs, "Heather", "#B7A9BE"},
        {MicroSeason::SoftSummer, ColorGroup::Softs, "Powder Pink", "#D9BFC4"},
        {MicroSeason::SoftSummer, ColorGroup::Softs, "Soft Aqua", "#A7C6C5"},
        {MicroSeason::SoftSummer, ColorGroup::Softs, "Muted Lavender", "#A89BB5"},

        // cool_summer
        {MicroSeason::CoolSummer, ColorGroup::Neutrals, "Cool Gray", "#9AA0A8"},
        {MicroSeason::CoolSummer, ColorGroup::Neutrals, "Soft Navy", "#3D4F7C"},
        {MicroSeason::CoolSummer, ColorGroup::Neutrals, "Rose Beige", "#CDB7B5"},
        {MicroSeason::CoolSummer, ColorGroup::Neutrals, "Blue Gray", "#7D8CA3"},
        {MicroSeason::CoolSummer, ColorGroup::Neutrals, "Cool Taupe", "#93878A"},
        {MicroSeason::CoolSummer, ColorGroup::Accents, "Cool Rose", "#D48FA5"},
        {MicroSeason::CoolSummer, ColorGroup::Accents, "Sky Blue", "#7FB2E5"},
        {MicroSeason::CoolSummer, ColorGroup::Accents, "Soft Teal Blue", "#4F9BA8"},
        {MicroSeason::CoolSummer, ColorGroup::Accents, "Orchid", "#B07CC6"},
        {MicroSeason::CoolSummer, ColorGroup::Accents, "Cool Berry", "#A04A78"},
        {MicroSeason::CoolSummer, ColorGroup::Brights, "Watermelon", "#E05477"},
        {MicroSeason::CoolSummer, ColorGroup::Brights, "Cornflower", "#6495ED"},
        {MicroSeason::CoolSummer, ColorGroup::Brights, "Cool Jade", "#3EA38A"},
        {MicroSeason::CoolSummer, ColorGroup::Brights, "Royal Lavender", "#8A6FD1"},
        {MicroSeason::CoolSummer, ColorGroup::Brights, "Fuchsia Rose", "#C74375"},
        {MicroSeason::CoolSummer, ColorGroup::Softs, "Powder Blue", "#B0CBE6"},
        {MicroSeason::CoolSummer, ColorGroup::Softs, "Cool Lilac", "#C8B6DB"},
        {MicroSeason::CoolSummer, ColorGroup::Softs, "Ballet Pink", "#F0C1CC"},
        {MicroSeason::CoolSummer, ColorGroup::Softs, "Seafoam", "#A6D8CF"},
        {MicroSeason::CoolSummer, ColorGroup::Softs, "Silver Blue", "#BCC6D3"},

        // light_summer
        {MicroSeason::LightSummer, ColorGroup::Neutrals, "Soft White", "#F5F3EF"},
        {MicroSeason::LightSummer, ColorGroup::Neutrals, "Light Gray", "#D3D3D6"},
        {MicroSeason::LightSummer, ColorGroup::Neutrals, "Cool Beige", "#E3DBD3"},
        {MicroSeason::LightSummer, ColorGroup::Neutrals, "Light Taupe", "#C2B6AE"},
        {MicroSeason::LightSummer, ColorGroup::Neutrals, "Silver", "#C0C3C9"},
        {MicroSeason::LightSummer, ColorGroup::Accents, "Lavender", "#C7B8E0"},
        {MicroSeason::LightSummer, ColorGroup::Accents, "Light Rose", "#F2AFC0"},
        {MicroSeason::LightSummer, ColorGroup::Accents, "Soft Periwinkle", "#A3B4EB"},
        {MicroSeason::LightSummer, ColorGroup::Accents, "Pale Aqua", "#9ED9D2"},
        {MicroSeason::LightSummer, ColorGroup::Accents, "Light Mauve", "#D2A8C9"},
        {MicroSeason::LightSummer, ColorGroup::Brights, "Sweet Pea", "#F48FB1"},
        {MicroSeason::LightSummer, ColorGroup::Brights, "Clear Sky", "#6CB4EE"},
        {MicroSeason::LightSummer, ColorGroup::Brights, "Light Jade", "#5FC9A8"},
        {MicroSeason::LightSummer, ColorGroup::Brights, "Light Raspberry", "#E0719A"},
        {MicroSeason::LightSummer, ColorGroup::Brights, "Lilac", "#B48FE0"},
        {MicroSeason::LightSummer, ColorGroup::Softs, "Cloud Pink", "#F7DDE3"},
        {MicroSeason::LightSummer, ColorGroup::Softs, "Misty Blue", "#C6D7E2"},
        {MicroSeason::LightSummer, ColorGroup::Softs, "Soft Lilac", "#E3D4F2"},
        {MicroSeason::LightSummer, ColorGroup::Softs, "Mint Frost", "#D3EDE4"},
        {MicroSeason::LightSummer, ColorGroup::Softs, "Pearl Gray", "#E2E2E4"},

        // deep_autumn
        {MicroSeason::DeepAutumn, ColorGroup::Neutrals, "Dark Chocolate", "#4A2C2A"},
        {MicroSeason::DeepAutumn, ColorGroup::Neutrals, "Espresso", "#3C2A21"},
        {MicroSeason::DeepAutumn, ColorGroup::Neutrals, "Deep Olive", "#4B5320"},
        {MicroSeason::DeepAutumn, ColorGroup::Neutrals, "Charcoal Brown", "#3B3531"},
        {MicroSeason::DeepAutumn, ColorGroup::Neutrals, "Bronze", "#8C6A3E"},
        {MicroSeason::DeepAutumn, ColorGroup::Accents, "Burgundy", "#7A1F2B"},
        {MicroSeason::DeepAutumn, ColorGroup::Accents, "Deep Teal", "#0F5C5C"},
        {MicroSeason::DeepAutumn, ColorGroup::Accents, "Burnt Orange", "#CC5500"},
        {MicroSeason::DeepAutumn, ColorGroup::Accents, "Aubergine", "#5B2A4E"},
        {MicroSeason::DeepAutumn, ColorGroup::Accents, "Forest Green", "#2E5D34"},
        {MicroSeason::DeepAutumn, ColorGroup::Brights, "Tomato Red", "#D7382C"},
        {MicroSeason::DeepAutumn, ColorGroup::Brights, "Pumpkin", "#F18F01"},
        {MicroSeason::DeepAutumn, ColorGroup::Brights, "Deep Turquoise", "#007C80"},
        {MicroSeason::DeepAutumn, ColorGroup::Brights, "Goldenrod", "#DAA520"},
        {MicroSeason::DeepAutumn, ColorGroup::Brights, "Paprika", "#B5341E"},
        {MicroSeason::DeepAutumn, ColorGroup::Softs, "Mahogany", "#6C3B2A"},
        {MicroSeason::DeepAutumn, ColorGroup::Softs, "Olive Drab", "#6B6B3A"},
        {MicroSeason::DeepAutumn, ColorGroup::Softs, "Rust Brown", "#8B4A2F"},
        {MicroSeason::DeepAutumn, ColorGroup::Softs, "Dark Khaki", "#8A7D55"},
        {MicroSeason::DeepAutumn, ColorGroup::Softs, "Plum Brown", "#5E3A40"},

        // soft_autumn
        {MicroSeason::SoftAutumn, ColorGroup::Neutrals, "Oatmeal", "#D8CBB0"},
        {MicroSeason::SoftAutumn, ColorGroup::Neutrals, "Soft Camel", "#B89F7C"},
        {MicroSeason::SoftAutumn, ColorGroup::Neutrals, "Mushroom Taupe", "#9E8F7E"},
        {MicroSeason::SoftAutumn, ColorGroup::Neutrals, "Warm Stone", "#A69A86"},
        {MicroSeason::SoftAutumn, ColorGroup::Neutrals, "Cocoa", "#7B6455"},
        {MicroSeason::SoftAutumn, ColorGroup::Accents, "Salmon", "#D99A85"},
        {MicroSeason::SoftAutumn, ColorGroup::Accents, "Sage", "#9CAF88"},
        {MicroSeason::SoftAutumn, ColorGroup::Accents, "Soft Terracotta", "#C08570"},
        {MicroSeason::SoftAutumn, ColorGroup::Accents, "Muted Teal", "#5F8C86"},
        {MicroSeason::SoftAutumn, ColorGroup::Accents, "Dusty Olive", "#8F8B5F"},
        {MicroSeason::SoftAutumn, ColorGroup::Brights, "Muted Coral", "#D5806A"},
        {MicroSeason::SoftAutumn, ColorGroup::Brights, "Jade", "#4C9A83"},
        {MicroSeason::SoftAutumn, ColorGroup::Brights, "Soft Mustard", "#C9A94D"},
        {MicroSeason::SoftAutumn, ColorGroup::Brights, "Rosewood", "#A3585D"},
        {MicroSeason::SoftAutumn, ColorGroup::Brights, "Avocado", "#7A8A3C"},
        {MicroSeason::SoftAutumn, ColorGroup::Softs, "Khaki", "#BFB58F"},
        {MicroSeason::SoftAutumn, ColorGroup::Softs, "Dusty Peach", "#DDB7A0"},
        {MicroSeason::SoftAutumn, ColorGroup::Softs, "Soft Moss", "#A9AC85"},
        {MicroSeason::SoftAutumn, ColorGroup::Softs, "Grayed Teal", "#8AA39E"},
        {MicroSeason::SoftAutumn, ColorGroup::Softs, "Antique Rose", "#B88C86"},

        // warm_autumn
        {MicroSeason::WarmAutumn, ColorGroup::Neutrals, "Warm Beige", "#E6D5B8"},
        {MicroSeason::WarmAutumn, ColorGroup::Neutrals, "Caramel", "#B78B57"},
        {MicroSeason::WarmAutumn, ColorGroup::Neutrals, "Olive Taupe", "#B6A892"},
        {MicroSeason::WarmAutumn, ColorGroup::Neutrals, "Coffee", "#6F4E37"},
        {MicroSeason::WarmAutumn, ColorGroup::Neutrals, "Golden Khaki", "#C3A96E"},
        {MicroSeason::WarmAutumn, ColorGroup::Accents, "Terracotta", "#C96541"},
        {MicroSeason::WarmAutumn, ColorGroup::Accents, "Rust", "#B4441C"},
        {MicroSeason::WarmAutumn, ColorGroup::Accents, "Mustard", "#D3A63C"},
        {MicroSeason::WarmAutumn, ColorGroup::Accents, "Warm Olive", "#8E8C53"},
        {MicroSeason::WarmAutumn, ColorGroup::Accents, "Teal", "#1B998B"},
        {MicroSeason::WarmAutumn, ColorGroup::Brights, "Marigold", "#FFC145"},
        {MicroSeason::WarmAutumn, ColorGroup::Brights, "Moss Green", "#8FAE3E"},
        {MicroSeason::WarmAutumn, ColorGroup::Brights, "Brick Red", "#A23E3D"},
        {MicroSeason::WarmAutumn, ColorGroup::Brights, "Copper", "#B87333"},
        {MicroSeason::WarmAutumn, ColorGroup::Brights, "Saffron", "#F4C430"},
        {MicroSeason::WarmAutumn, ColorGroup::Softs, "Clay", "#C9A28C"},
        {MicroSeason::WarmAutumn, ColorGroup::Softs, "Muted Gold", "#D6BA6A"},
        {MicroSeason::WarmAutumn, ColorGroup::Softs, "Dusty Sage", "#A3A380"},
        {MicroSeason::WarmAutumn, ColorGroup::Softs, "Cinnamon", "#B5724A"},
        {MicroSeason::WarmAutumn, ColorGroup::Softs, "Soft Olive", "#A89F80"},

        // bright_winter
        {MicroSeason::BrightWinter, ColorGroup::Neutrals, "Optic White", "#EEF2F8"},
        {MicroSeason::BrightWinter, ColorGroup::Neutrals, "Jet Black", "#0A0A0A"},
        {MicroSeason::BrightWinter, ColorGroup::Neutrals, "Bright Navy", "#1F2A6B"},
        {MicroSeason::BrightWinter, ColorGroup::Neutrals, "Cool Charcoal", "#36393F"},
        {MicroSeason::BrightWinter, ColorGroup::Neutrals, "Icy Gray", "#C9CDD4"},
        {MicroSeason::BrightWinter, ColorGroup::Accents, "Electric Blue", "#2E5BFF"},
        {MicroSeason::BrightWinter, ColorGroup::Accents, "Shocking Pink", "#FC0FC0"},
        {MicroSeason::BrightWinter, ColorGroup::Accents, "Bright Turquoise", "#08E8DE"},
        {MicroSeason::BrightWinter, ColorGroup::Accents, "Violet", "#7F00FF"},
        {MicroSeason::BrightWinter, ColorGroup::Accents, "Lemon Yellow", "#FFF44F"},
        {MicroSeason::BrightWinter, ColorGroup::Brights, "True Red", "#FF0000"},
        {MicroSeason::BrightWinter, ColorGroup::Brights, "Hot Magenta", "#FF1DCE"},
        {MicroSeason::BrightWinter, ColorGroup::Brights, "Royal Blue", "#4169E1"},
        {MicroSeason::BrightWinter, ColorGroup::Brights, "Bright Emerald", "#00C78C"},
        {MicroSeason::BrightWinter, ColorGroup::Brights, "Cyan", "#00B7EB"},
        {MicroSeason::BrightWinter, ColorGroup::Softs, "Icy Pink", "#F8D8EC"},
        {MicroSeason::BrightWinter, ColorGroup::Softs, "Icy Blue", "#D6ECFF"},
        {MicroSeason::BrightWinter, ColorGroup::Softs, "Icy Mint", "#D5F7EA"},
        {MicroSeason::BrightWinter, ColorGroup::Softs, "Icy Lemon", "#FAF8C8"},
        {MicroSeason::BrightWinter, ColorGroup::Softs, "Icy Violet", "#E2D6FF"},

        // cool_winter
        {MicroSeason::CoolWinter, ColorGroup::Neutrals, "True White", "#FFFFFF"},
        {MicroSeason::CoolWinter, ColorGroup::Neutrals, "Cool Black", "#121212"},
        {MicroSeason::CoolWinter, ColorGroup::Neutrals, "Charcoal", "#333333"},
        {MicroSeason::CoolWinter, ColorGroup::Neutrals, "Navy", "#000080"},
        {MicroSeason::CoolWinter, ColorGroup::Neutrals, "Silver Gray", "#A9ADB3"},
        {MicroSeason::CoolWinter, ColorGroup::Accents, "Fuchsia", "#E3007E"},
        {MicroSeason::CoolWinter, ColorGroup::Accents, "Berry", "#B8004E"},
        {MicroSeason::CoolWinter, ColorGroup::Accents, "Royal Purple", "#5A2D82"},
        {MicroSeason::CoolWinter, ColorGroup::Accents, "Sapphire", "#0F52BA"},
        {MicroSeason::CoolWinter, ColorGroup::Accents, "Pine Green", "#01796F"},
        {MicroSeason::CoolWinter, ColorGroup::Brights, "Crimson", "#D1002C"},
        {MicroSeason::CoolWinter, ColorGroup::Brights, "Blue Red", "#C8102E"},
        {MicroSeason::CoolWinter, ColorGroup::Brights, "Emerald", "#009975"},
        {MicroSeason::CoolWinter, ColorGroup::Brights, "Cool Magenta", "#D0417E"},
        {MicroSeason::CoolWinter, ColorGroup::Brights, "True Blue", "#0073CF"},
        {MicroSeason::CoolWinter, ColorGroup::Softs, "Icy Lavender", "#D6D4F7"},
        {MicroSeason::CoolWinter, ColorGroup::Softs, "Frost Blue", "#D8EAFE"},
        {MicroSeason::CoolWinter, ColorGroup::Softs, "Ice Pink", "#F6D3E6"},
        {MicroSeason::CoolWinter, ColorGroup::Softs, "Cool Plum", "#836283"},
        {MicroSeason::CoolWinter, ColorGroup::Softs, "Soft Wine", "#C79CA6"},

        // deep_winter
        {MicroSeason::DeepWinter, ColorGroup::Neutrals, "Black", "#000000"},
        {MicroSeason::DeepWinter, ColorGroup::Neutrals, "Dark Charcoal", "#2B2B2E"},
        {MicroSeason::DeepWinter, ColorGroup::Neutrals, "Midnight Navy", "#14213D"},
        {MicroSeason::DeepWinter, ColorGroup::Neutrals, "Deep Taupe", "#4A4245"},
        {MicroSeason::DeepWinter, ColorGroup::Neutrals, "Graphite", "#53565C"},
        {MicroSeason::DeepWinter, ColorGroup::Accents, "Deep Burgundy", "#6D0F2A"},
        {MicroSeason::DeepWinter, ColorGroup::Accents, "Plum", "#5B1E4F"},
        {MicroSeason::DeepWinter, ColorGroup::Accents, "Deep Emerald", "#045D46"},
        {MicroSeason::DeepWinter, ColorGroup::Accents, "Ink Blue", "#1B2F6E"},
        {MicroSeason::DeepWinter, ColorGroup::Accents, "Deep Teal Blue", "#0B4F6C"},
        {MicroSeason::DeepWinter, ColorGroup::Brights, "Cherry Red", "#B3001B"},
        {MicroSeason::DeepWinter, ColorGroup::Brights, "Deep Magenta", "#A0025C"},
        {MicroSeason::DeepWinter, ColorGroup::Brights, "Bright Pine", "#00856F"},
        {MicroSeason::DeepWinter, ColorGroup::Brights, "Indigo", "#3F2A8C"},
        {MicroSeason::DeepWinter, ColorGroup::Brights, "Ruby", "#9B111E"},
        {MicroSeason::DeepWinter, ColorGroup::Softs, "Mulberry", "#6B3A5C"},
        {MicroSeason::DeepWinter, ColorGroup::Softs, "Dusky Blue", "#3E4F6B"},
        {MicroSeason::DeepWinter, ColorGroup::Softs, "Dark Spruce", "#2F4A45"},
        {MicroSeason::DeepWinter, ColorGroup::Softs, "Raisin", "#4B2E39"},
        {MicroSeason::DeepWinter, ColorGroup::Softs, "Storm Gray", "#5A5F66"},
    };
    return entries;
}

}
