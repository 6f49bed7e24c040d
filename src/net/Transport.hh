// Copyright 2018-2022 Drexel University
// Author: Geoffrey Mainland <mainland@drexel.edu>

#ifndef TRANSPORT_HH_
#define TRANSPORT_HH_

#include <string>

/** @brief The connection to an access point */
/** A transport carries command lines to the device. Connection management and
 * reading the device's event stream are the transport's business; received
 * lines are handed to a Dispatcher.
 */
class Transport {
public:
    Transport() = default;

    virtual ~Transport() = default;

    /** @brief Send one command line.
     * The line has no trailing newline.
     * @throw std::runtime_error if the line could not be sent
     */
    virtual void send(const std::string &line) = 0;
};

#endif /* TRANSPORT_HH_ */
