#include "response_templates.hpp"
#include <map>
#include <sstream>

namespace worker {

const ResponseTemplate &templateFor(Category category) {
    static const std::map<Category, ResponseTemplate> templates = {
        {Category::Anxiety, {
            "I understand how overwhelming anxiety can feel, and you're not alone in experiencing this.",
            {
                "Practice the 4-7-8 breathing technique: breathe in for 4, hold for 7, out for 8",
                "Use the 5-4-3-2-1 grounding method: 5 things you see, 4 you touch, 3 you hear, 2 you smell, 1 you taste",
                "Challenge anxious thoughts by asking: 'Is this thought helpful? What evidence supports or contradicts it?'"
            },
            "Remember, anxiety is treatable and you have the strength to work through this step by step."
        }},
        {Category::Depression, {
            "I hear the heaviness you're carrying, and it takes real courage to reach out for support.",
            {
                "Start with small, achievable daily goals - even getting dressed or making your bed counts",
                "Practice behavioral activation: schedule one small pleasant activity each day",
                "Connect with one supportive person, even if it's just a brief text or call"
            },
            "Depression tells lies about your worth. You matter, and this feeling won't last forever."
        }},
        {Category::Stress, {
            "Feeling overwhelmed by stress is completely understandable given what you're facing.",
            {
                "Practice progressive muscle relaxation: tense and release each muscle group for 5 seconds",
                "Break overwhelming tasks into smaller, manageable steps",
                "Set boundaries: it's okay to say no to additional responsibilities right now"
            },
            "You're stronger than you realize, and learning to manage stress is a skill that improves with practice."
        }},
        {Category::Relationship, {
            "Relationship challenges can feel deeply personal and confusing. Your feelings are valid.",
            {
                "Practice 'I' statements: 'I feel...' instead of 'You always...'",
                "Listen actively: repeat back what you heard before responding",
                "Take breaks during heated discussions to cool down and reflect"
            },
            "Healthy relationships take work from both people, and you're showing wisdom by seeking guidance."
        }},
        {Category::Sleep, {
            "Sleep difficulties can be incredibly frustrating and impact every aspect of your well-being.",
            {
                "Create a consistent bedtime routine: same time, same calming activities each night",
                "Keep your bedroom cool, dark, and quiet - consider blackout curtains or white noise",
                "Avoid screens 1 hour before bed; try reading or gentle stretching instead"
            },
            "Good sleep hygiene takes time to establish, but your body will thank you for the consistency."
        }},
        {Category::General, {
            "Thank you for sharing what's on your mind. Your feelings and experiences are important.",
            {
                "Practice mindfulness: spend 5 minutes focusing on your breath each day",
                "Keep a gratitude journal: write down 3 things you're grateful for daily",
                "Engage in regular physical activity, even a 10-minute walk can boost mood"
            },
            "Taking care of your mental health is an ongoing journey, and every small step matters."
        }},
    };
    return templates.at(category);
}

std::string buildTemplateResponse(Category category) {
    const ResponseTemplate &tmpl = templateFor(category);

    std::ostringstream ss;
    ss << tmpl.validation << "\n\n"
       << "Here are some evidence-based strategies that can help:\n";
    for (size_t i = 0; i < tmpl.techniques.size() && i < 2; ++i) {
        ss << (i + 1) << ". " << tmpl.techniques[i] << "\n";
    }
    ss << "\n" << tmpl.encouragement;
    return ss.str();
}

const std::string &crisisResponse() {
    static const std::string response =
        "I'm deeply concerned about what you've shared. Your life has value and meaning, even when it doesn't feel that way.\n"
        "\n"
        "Please reach out for immediate support:\n"
        "- National Suicide Prevention Lifeline: 988 or 1-800-273-8255\n"
        "- Crisis Text Line: Text HOME to 741741\n"
        "- Emergency Services: 911\n"
        "\n"
        "You don't have to face this alone. Professional counselors are available 24/7 and want to help. "
        "Please consider reaching out to a mental health professional or trusted person in your life right now.";
    return response;
}

const std::string &safeFallbackResponse() {
    static const std::string response =
        "I understand you're going through a difficult time, and I want you to know that your feelings are valid. "
        "While I'm having trouble processing your specific situation right now, I encourage you to:\n"
        "\n"
        "1. Take some deep breaths and ground yourself in the present moment\n"
        "2. Reach out to a trusted friend, family member, or mental health professional\n"
        "3. Practice self-compassion - treat yourself with the same kindness you'd show a good friend\n"
        "\n"
        "Remember, seeking help is a sign of strength, and you don't have to face this alone. "
        "If you're in crisis, please contact a mental health hotline or emergency services immediately.";
    return response;
}

const std::string &therapistSystemPrompt() {
    static const std::string prompt =
        "You are a licensed clinical psychologist with 15+ years of experience in cognitive behavioral therapy (CBT) "
        "and mindfulness-based interventions.\n"
        "\n"
        "Your response guidelines:\n"
        "1. EMPATHY FIRST: Always validate the person's feelings\n"
        "2. EVIDENCE-BASED: Use proven therapeutic techniques (CBT, DBT, mindfulness)\n"
        "3. ACTIONABLE: Provide 2-3 specific, practical strategies\n"
        "4. PROFESSIONAL: Maintain appropriate boundaries\n"
        "5. CONCISE: Keep responses 100-150 words for optimal engagement\n"
        "\n"
        "Structure your response:\n"
        "- Acknowledge and validate their experience\n"
        "- Provide 2-3 evidence-based coping strategies\n"
        "- End with encouragement and hope\n"
        "\n"
        "Remember: You're providing supportive guidance, not diagnosing or replacing professional treatment.";
    return prompt;
}

} // namespace worker
