// Copyright 2024 Nicholas J. Kain <njkain at gmail dot com>
// SPDX-License-Identifier: MIT
#ifndef TAPRA6_SBUFS_H_
#define TAPRA6_SBUFS_H_

#include <stddef.h>
#include <stdint.h>

// Read cursor over a received datagram.
struct sbufs {
    const uint8_t *si;
    const uint8_t *se;

    size_t brem() const { return se > si ? static_cast<size_t>(se - si) : 0; }
};

#endif
