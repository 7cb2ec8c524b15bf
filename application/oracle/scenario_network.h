/** @file
*****************************************************************************

Networking for the oracle scenario

Parties of the scenario are addressed by name and exchange messages point to
point. A message is identified by topic, sender, receiver and round. Messages
are either kept in RAM (boost::any) or written to files, the latter
exercises serialization of keys, quotes and proofs.
*****************************************************************************/

#ifndef PRICESNARK_SCENARIO_NETWORK_H
#define PRICESNARK_SCENARIO_NETWORK_H

#include <cstdint>
#include <string>
#include <iostream>
#include <fstream>
#include <map>
#include <stdexcept>
#include <boost/any.hpp>

class message_missing_error : public std::runtime_error {
public:
    explicit message_missing_error(const std::string &handle) :
        std::runtime_error("no message " + handle) {}
};

class Communicator {
private:
    std::map<std::string, boost::any> map;
    uint16_t round;

    std::string handle(const std::string &topic, const std::string &from, const std::string &to) const {
        return topic + "_" + from + "_" + to + "_R" + std::to_string(round);
    }

public:
    enum CommunicationMode {File, Ram};

    CommunicationMode mode;

    Communicator(CommunicationMode mode=Ram)
    :  round(0), mode(mode) {}

    uint16_t get_round() const {
        return round;
    }

    void tick(){
        round++;
    }

    template<typename T>
    void send_to(const T &content, const std::string &topic, const std::string &from, const std::string &to, bool binary=false){
        const std::string h = handle(topic, from, to);
        if (mode == File){
            std::ofstream output_file;
            if (binary) {
                output_file.open(h, std::ios::out | std::ios::binary);
            }else{
                output_file.open(h, std::ios::out);
            }
            if (!output_file.is_open()){
                throw std::runtime_error("cannot write " + h);
            }
            output_file << content;
            output_file.close();
        }else{
            map[h] = content;
        }
    }

    template<typename T>
    T receive_from(const std::string &topic, const std::string &from, const std::string &to, bool binary=false){
        T content;
        const std::string h = handle(topic, from, to);
        if (mode == File){
            std::ifstream input_file;
            if (binary) {
                input_file.open(h, std::ios::in | std::ios::binary);
            }else{
                input_file.open(h, std::ios::in);
            }
            if (!input_file.is_open()){
                throw message_missing_error(h);
            }

            if (binary) {
                input_file >> std::noskipws >> content;
            }else{
                input_file >> content;
            }

            input_file.close();
        } else{
            auto it = map.find(h);
            if (it == map.end()){
                throw message_missing_error(h);
            }
            content = boost::any_cast<T>(it->second);
        }
        return content;
    }

};

class NetworkParticipant {
private:
    Communicator &comm;
protected:
    bool silent;

    uint16_t get_round() const {
        return comm.get_round();
    }

    template<typename T>
    void send_to(const T &content, const std::string &topic, const std::string &to, bool binary=false) {
        comm.send_to<T>(content, topic, name, to, binary);
    }

    template<typename T>
    T receive_from(const std::string &topic, const std::string &from, bool binary=false) {
        return comm.receive_from<T>(topic, from, name, binary);
    }

public:
    std::string name;
    NetworkParticipant(const std::string &name, Communicator &comm, bool silent=false) : comm(comm), silent(silent), name(name)  {}
};

#endif //PRICESNARK_SCENARIO_NETWORK_H
