#include "config.hpp"

HeroConfig defaultConfig()
{
    HeroConfig config;
    config.messages = {
        { "Hi there,\nI am Matthias", "" },
        { "a software developer", "" },
        { "a bikepacker", "bikepacker" },
        { "who likes Badminton", "" },
        { "and creative things.", "" },
        { "These are my notes.", "" },
        { "Enjoy!", "" },
    };
    return config;
}
