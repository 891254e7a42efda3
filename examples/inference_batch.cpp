#include <iostream>
#include <vector>
#include <string>

#include "CharNER/charner_config.hpp"
#include "CharNER/model.hpp"
#include "CharNER/processor.hpp"
#include "CharNER/predictor.hpp"
#include "CharNER/tokenizer_utils.hpp"

int main(int argc, char** argv) {
    std::string modelDir = argc > 1 ? argv[1] : "./bert_crf_ner";
    int deviceId = argc > 2 ? std::stoi(argv[2]) : -1;

    charner::Config config{512, charner::BERT, charner::VITERBI};
    config.outputsLogits = true;
    charner::LabelVocabulary labels = charner::LoadLabels(modelDir + "/labels.txt");

    charner::OnnxModel model(modelDir + "/model.onnx", config, deviceId);
    charner::CharProcessor processor(config, modelDir + "/tokenizer.json", labels);
    charner::Predictor predictor(model, processor);

    std::vector<charner::TextInput> texts = {
        "北京天安门",
        charner::TextInput::tokenized({"张", "三", "在", "上", "海", "工", "作"}),
        "",
    };

    auto tags = predictor.tagBatch(texts);
    auto output = predictor.prettyTagBatch(texts);

    for (size_t batch = 0; batch < output.size(); ++batch) {
        std::cout << "Text " << batch << " tags:";
        for (const auto& tag : tags[batch]) {
            std::cout << " " << tag;
        }
        std::cout << std::endl;
        for (const auto& entity : output[batch].entities) {
            std::cout << "  Entity: [" << entity.beginOffset << ", " << entity.endOffset << "), "
                      << "Type: " << entity.type << ", "
                      << "Text: " << entity.text << ", "
                      << "Score: " << entity.score << std::endl;
        }
    }

    return 0;
}
