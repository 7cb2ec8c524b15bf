/** @file
 *****************************************************************************

 Demo application for the price aggregation SNARK consisting of

 Generator: Setup the aggregation relation and send prover and verification
 keys to the other parties. Generator is assumed to be honest.

 Publishers: each owns an EdDSA keypair and registers its public key with
 the aggregator. In each round a publisher observes a price around a
 drifting reference price, signs the quote and sends it to the aggregator.
 A publisher can be configured to send stale quotes.

 Aggregator: collects the signed quotes of a round, builds the witness,
 checks it and proves the aggregate (p25, p50, p75, confidence, fee). If
 the witness does not satisfy the circuit the unsatisfied constraints are
 printed and no valid proof is sent.

 Verifier: accepts the aggregate and uses the proof to check it

 *****************************************************************************/

#include <fstream>
#include <sstream>
#include <string>
#include <vector>
#include <boost/program_options.hpp>

#include "libff/common/default_types/ec_pp.hpp"
#include "libff/common/profiling.hpp"

#include "scenario_network.h"
#include "price_feed.h"
#include "pricesnark/pricesnark.hpp"
#include "pricesnark/witness_builder.hpp"

typedef libff::default_ec_pp EcPP;
typedef libff::Fr<EcPP> SFieldT;

static std::string field_to_decimal(const SFieldT &value)
{
    std::stringstream ss;
    ss << value.as_bigint();
    return ss.str();
}

class Publisher : NetworkParticipant {
private:
    ethsnarks::eddsa_keypair key;
    size_t id;
    bool stale;

    QuoteVals<SFieldT> observe(uint64_t timestamp_threshold);
public:
    Publisher(const std::string &name, size_t id, Communicator &comm, bool stale=false) :
        NetworkParticipant(name, comm), id(id), stale(stale)
        {}
    void setup();
    void run(uint64_t timestamp_threshold);
};

void Publisher::setup(){
    key = generate_publisher_key();
    this->send_to(field_to_decimal(publisher_pubkey_x<SFieldT>(key)), "pubkey", "Aggregator");
}

QuoteVals<SFieldT> Publisher::observe(uint64_t timestamp_threshold){
    const observation o = observe_market(id, get_round(), stale, timestamp_threshold);
    return make_quote<SFieldT>(o.price, o.confidence, o.timestamp, o.observed_online);
}

void Publisher::run(uint64_t timestamp_threshold){
    const signed_quote<SFieldT> quote = sign_quote(key, observe(timestamp_threshold));
    this->send_to(quote, "quote", "Aggregator");
}

class Aggregator : NetworkParticipant {
private:
    circuit_params params;
    SFieldT fee;
    std::vector<std::string> publishers;
    pricesnark_proving_key<EcPP> pk;
    ethsnarks::eddsa_keypair padding_key;
    std::shared_ptr<pricesnark_relation<EcPP>> relation;

public:
    Aggregator(const std::string &name, Communicator &comm, const circuit_params &params, uint64_t fee,
               const std::vector<std::string> &publishers, bool silent=false) :
        NetworkParticipant(name, comm, silent), params(params), fee(field_from_ulong<SFieldT>(fee)), publishers(publishers)
        {}
    void setup(bool register_publishers);
    void run();
};

void Aggregator::setup(bool register_publishers){
    pk = this->receive_from<pricesnark_proving_key<EcPP>>("pk", "Generator");

    if (register_publishers && params.valid_pubkeys.empty()){
        for (size_t i = 0; i < publishers.size(); ++i){
            params.valid_pubkeys.push_back(this->receive_from<std::string>("pubkey", publishers[i]));
        }
    }

    padding_key = generate_publisher_key();
    relation.reset(new pricesnark_relation<EcPP>(params));
}

void Aggregator::run(){
    std::vector<signed_quote<SFieldT>> quotes;
    for (size_t i = 0; i < publishers.size(); ++i){
        quotes.push_back(this->receive_from<signed_quote<SFieldT>>("quote", publishers[i]));
    }

    const aggregate_input<SFieldT> input = make_aggregate_input(params.max_quotes, quotes, fee, padding_key);

    pricesnark_outputs<EcPP> outputs;
    pricesnark_proof<EcPP> proof;
    try {
        proof = pricesnark_prover<EcPP>(pk, *relation, input, outputs);
    } catch (const unsatisfied_circuit_error &e) {
        std::cerr << name << ": round " << get_round() << " not provable: " << e.what() << std::endl;
        if (!silent){
            const std::vector<unsatisfied_constraint> failed = relation->unsatisfied_constraints();
            for (size_t i = 0; i < failed.size(); ++i){
                std::cerr << "  " << failed[i] << std::endl;
            }
        }
        outputs = relation->outputs();
    }

    this->send_to(outputs, "outputs", "Verifier");
    this->send_to(proof, "proof", "Verifier");
}

class Generator : NetworkParticipant {
private:
    circuit_params params;
public:
    Generator(const std::string &name, Communicator &comm, const circuit_params &params) :
        NetworkParticipant(name, comm), params(params) {}
    void setup();
};

void Generator::setup(){
    pricesnark_relation<EcPP> relation(params);
    libff::enter_block("Generate keys");
    pricesnark_keypair<EcPP> keypair = pricesnark_generator<EcPP>(relation);
    libff::leave_block("Generate keys");

    this->send_to(keypair.pk, "pk", "Aggregator");
    this->send_to(keypair.vk, "vk", "Verifier");
}

class Verifier : NetworkParticipant {
private:
    pricesnark_processed_verification_key<EcPP> pvk;
public:
    int confirmed_count;
    int error_count;
    Verifier(const std::string &name, Communicator &comm, bool silent=false) :
        NetworkParticipant(name, comm, silent), confirmed_count(0), error_count(0) {}
    void setup();
    void run();
};

void Verifier::setup(){
    pricesnark_verification_key<EcPP> vk = this->receive_from<pricesnark_verification_key<EcPP>>("vk", "Generator");
    pvk = pricesnark_verifier_process_vk<EcPP>(vk);
}

void Verifier::run(){
    const auto outputs = this->receive_from<pricesnark_outputs<EcPP>>("outputs", "Aggregator");
    const auto proof = this->receive_from<pricesnark_proof<EcPP>>("proof", "Aggregator");

    libff::enter_block("Verify aggregate");
    const bool verified = pricesnark_online_verifier<EcPP>(pvk, outputs, proof);
    libff::leave_block("Verify aggregate");
    if (!verified){
        std::cerr << "SNARK does not verify in round " << get_round() << std::endl;
    }

    if (!silent) {
        std::cout << "Round " << get_round()
                  << " p25=" << outputs.p25.as_ulong()
                  << " p50=" << outputs.p50.as_ulong()
                  << " p75=" << outputs.p75.as_ulong()
                  << " confidence=" << outputs.confidence.as_ulong()
                  << " fee=" << outputs.fee.as_ulong()
                  << " Verified: " << verified << std::endl;
    }
    if (verified){
        confirmed_count++;
    }else{
        error_count++;
    }
}


int main(int argc, char *argv[]) {
    namespace po = boost::program_options;
    int rounds;
    size_t max_quotes;
    size_t num_publishers;
    uint64_t timestamp_threshold;
    uint64_t fee;
    int stale_publisher;
    std::vector<std::string> valid_pubkeys;
    std::string config_file;

    std::cout << "Price Aggregation Scenario" << std::endl;
    po::options_description desc("Usage");
    po::variables_map vm;
    desc.add_options()
            ("help", "show help")
            ("config", po::value<std::string>(&config_file), "read options from an INI file")
            ("generator", "Generate prover and verifier key")
            ("publisher", "Run the publishers")
            ("aggregator", "Aggregate quotes and generate proof")
            ("verifier", "Check proof")
            ("all", "Run generator, publishers, aggregator and verifier")
            ("silent", "Do not print outputs")
            ("rounds", po::value<int>(&rounds)->default_value(1), "run complete scenario with number of rounds")
            ("max-quotes", po::value<size_t>(&max_quotes)->default_value(4), "capacity of the circuit")
            ("publishers", po::value<size_t>(&num_publishers)->default_value(3), "number of publishers")
            ("timestamp-threshold", po::value<uint64_t>(&timestamp_threshold)->default_value(60), "staleness window in timestamp units")
            ("fee", po::value<uint64_t>(&fee)->default_value(0), "fee passed through to the aggregate")
            ("stale-publisher", po::value<int>(&stale_publisher)->default_value(-1), "index of a publisher sending stale quotes")
            ("valid-pubkey", po::value<std::vector<std::string>>(&valid_pubkeys)->composing(), "registered publisher key x-coordinate (decimal), repeatable")
            ("file", "Write messages to files");

    try {
        po::store(po::parse_command_line(argc, argv, desc), vm);
        if (vm.count("config")) {
            std::ifstream config(vm["config"].as<std::string>());
            if (!config.is_open()) {
                std::cerr << "cannot open config file " << vm["config"].as<std::string>() << std::endl;
                return 1;
            }
            po::store(po::parse_config_file(config, desc), vm);
        }
        po::notify(vm);
    } catch (const po::error &e) {
        std::cerr << e.what() << std::endl;
        std::cout << desc << std::endl;
        return 1;
    }

    if (vm.count("help") || argc <= 1) {
        std::cout << desc << std::endl;
        return 1;
    }

    const circuit_params params(max_quotes, timestamp_threshold, valid_pubkeys);
    try {
        params.validate();
        if (num_publishers > max_quotes) {
            throw std::invalid_argument("more publishers than max-quotes");
        }
    } catch (const std::invalid_argument &e) {
        std::cerr << "invalid configuration: " << e.what() << std::endl;
        return 1;
    }

    EcPP::init_public_params();
    ethsnarks::default_inner_ec_pp::init_public_params();
    const bool silent = vm.count("silent") > 0;
    const bool all = vm.count("all") > 0;

    // Disable profiling
#ifndef DEBUG
    libff::inhibit_profiling_info = true;
    libff::inhibit_profiling_counters = true;
#endif

    Communicator communicator;
    if (vm.count("file")) {
        communicator = Communicator(Communicator::CommunicationMode::File);
    } else {
        communicator = Communicator(Communicator::CommunicationMode::Ram);
    }

    std::vector<std::string> publisher_names;
    std::vector<std::shared_ptr<Publisher>> publishers;
    for (size_t i = 0; i < num_publishers; ++i) {
        publisher_names.push_back("Publisher" + std::to_string(i + 1));
        publishers.emplace_back(new Publisher(publisher_names.back(), i, communicator, (int) i == stale_publisher));
    }

    Generator gen("Generator", communicator, params);
    Aggregator aggregator("Aggregator", communicator, params, fee, publisher_names, silent);
    Verifier ver("Verifier", communicator, silent);

    const bool run_generator = all || vm.count("generator");
    const bool run_publisher = all || vm.count("publisher");
    const bool run_aggregator = all || vm.count("aggregator");
    const bool run_verifier = all || vm.count("verifier");

    long long start_time, end_time;
    try {
        if (run_generator) {
            std::cout << "generator ";
            gen.setup();
        }

        if (run_publisher) {
            std::cout << "publisher ";
            for (size_t i = 0; i < publishers.size(); ++i) {
                publishers[i]->setup();
            }
        }

        if (run_aggregator) {
            std::cout << "aggregator ";
            aggregator.setup(run_publisher);
        }

        if (run_verifier) {
            std::cout << "verifier ";
            ver.setup();
        }
        std::cout << std::endl;

        start_time = libff::get_nsec_time();
        for (int i = 0; i < rounds; i++) {
            if (run_publisher) {
                for (size_t j = 0; j < publishers.size(); ++j) {
                    publishers[j]->run(timestamp_threshold);
                }
            }
            if (run_aggregator) {
                aggregator.run();
            }
            if (run_verifier) {
                ver.run();
            }
            communicator.tick();
        }
        end_time = libff::get_nsec_time();
    } catch (const std::exception &e) {
        std::cerr << "scenario failed: " << e.what() << std::endl;
        return 1;
    }

    std::cout << rounds << " rounds completed." << std::endl;
    if (run_verifier) {
        std::cout << "Verifier - Confirmed: " << ver.confirmed_count << " Errors: " << ver.error_count << std::endl;
    }
    if (rounds > 0) {
        std::cout << "Duration: " << (end_time - start_time) / 1000 << "us, = " << (end_time - start_time) / 1000 / rounds << "us per round" << std::endl;
    }
    return ver.error_count > 0 ? 2 : 0;
}
