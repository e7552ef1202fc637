#pragma once

#define STRINGIFY(...) IMPL_STRINGIFY(__VA_ARGS__)
#define IMPL_STRINGIFY(...) #__VA_ARGS__
