#include <iostream>
#include <vector>
#include <string>

#include "CharNER/charner_config.hpp"
#include "CharNER/model.hpp"
#include "CharNER/processor.hpp"
#include "CharNER/predictor.hpp"
#include "CharNER/tokenizer_utils.hpp"

int main(int argc, char** argv) {
    std::string modelDir = argc > 1 ? argv[1] : "./bilstm_cnn_ner";

    charner::Config config{256};  // Set your maxLength
    charner::LabelVocabulary labels = charner::LoadLabels(modelDir + "/labels.txt");

    charner::OnnxModel model(modelDir + "/model.onnx", config);
    charner::CharProcessor processor(config, modelDir + "/tokenizer.json", labels);
    charner::Predictor predictor(model, processor);

    // A sample input
    charner::TaggedText output = predictor.prettyTag("我们变而以书会友，以书结缘，把欧美、港台流行的食品类图谱、画册、工具书汇集一堂。");

    std::cout << "\nCharNER Inference (" << output.chars.size() << " chars):" << std::endl;
    for (const auto& entity : output.entities) {
        std::cout << "  Entity: [" << entity.beginOffset << ", " << entity.endOffset << "), "
                  << "Type: " << entity.type << ", "
                  << "Text: " << entity.text << ", "
                  << "Score: " << entity.score << std::endl;
    }

    return 0;
}
