#include <GLFW/glfw3.h>

#include <algorithm>
#include <cfloat>
#include <cmath>
#include <cstdint>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>

#include <imgui.h>
#include <backends/imgui_impl_glfw.h>
#include <backends/imgui_impl_opengl3.h>

#include "aqua/Log.hpp"
#include "aqua/Math.hpp"
#include "aqua/Tank.hpp"

using namespace aqua;

static void glfwErrorCallback(const int code, const char *msg)
{
    logger()->error("GLFW error ({}): {}", code, msg ? msg : "");
}

static ImU32 stageColor(const Agent &a)
{
    if (!a.lifecycle())
        return IM_COL32(150, 220, 120, 255);
    switch (a.lifecycle()->stage())
    {
        case LifeStage::Baby:
            return IM_COL32(255, 230, 140, 255);
        case LifeStage::Juvenile:
            return IM_COL32(255, 170, 80, 255);
        case LifeStage::Adult:
            return IM_COL32(90, 170, 255, 255);
        case LifeStage::Elder:
            return IM_COL32(180, 140, 220, 255);
    }
    return IM_COL32_WHITE;
}

// Nearest other Active agent of the same species, for a manual interaction.
static Agent *nearestMate(Tank &tank, const Agent &a)
{
    Agent *best  = nullptr;
    float  bestD = std::numeric_limits<float>::max();
    for (Agent *o : tank.liveAgents())
    {
        if (o->id() == a.id() || o->species() != a.species())
            continue;
        if (const float d = len2(o->position() - a.position()); d < bestD)
        {
            bestD = d;
            best  = o;
        }
    }
    return best;
}

int main()
{
    glfwSetErrorCallback(glfwErrorCallback);

    if (!glfwInit())
    {
        logger()->critical("failed to init GLFW");
        return 1;
    }

    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 3);
    glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);

    GLFWwindow *window = glfwCreateWindow(1500, 900, "Aquarium", nullptr, nullptr);
    if (!window)
    {
        logger()->critical("failed to create window");
        glfwTerminate();
        return 1;
    }

    glfwMakeContextCurrent(window);
    glfwSwapInterval(1);

    // ===== ImGui init =====
    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGuiIO &io = ImGui::GetIO();
    io.ConfigFlags |= ImGuiConfigFlags_NavEnableKeyboard;
    ImGui::StyleColorsDark();

    ImGui_ImplGlfw_InitForOpenGL(window, true);
    ImGui_ImplOpenGL3_Init("#version 330");

    // ===== Tank =====
    TankConfig cfg;
    uint64_t   seed       = 1234567ULL;
    int        initialPop = 20;

    std::optional<Tank> tank;
    tank.emplace(cfg, seed);
    tank->seedInitial(initialPop);

    bool paused        = false;
    bool stepOnce      = false;
    int  ticksPerFrame = 1;

    std::optional<AgentId> selected;
    char                   savePath[256] = "aquarium.agents";

    // rolling history
    static constexpr int HISTORY = 240;
    static float         histPop[HISTORY]{};
    static float         histEnergy[HISTORY]{};
    static int           histHead = 0;

    auto pushHist = [&](const float pop, const float energy)
    {
        histPop[histHead]    = pop;
        histEnergy[histHead] = energy;
        histHead             = (histHead + 1) % HISTORY;
    };

    auto clearHist = [&]
    {
        std::fill(std::begin(histPop), std::end(histPop), 0.f);
        std::fill(std::begin(histEnergy), std::end(histEnergy), 0.f);
        histHead = 0;
    };

    // edge-triggered input helper
    auto keyPressedOnce = [&](const int key) -> bool
    {
        static bool prev[512]{};
        const bool  cur = glfwGetKey(window, key) == GLFW_PRESS;
        const bool  out = cur && !prev[key];
        prev[key]       = cur;
        return out;
    };

    double statTimer = 0.0;
    double lastTime  = glfwGetTime();

    while (!glfwWindowShouldClose(window))
    {
        glfwPollEvents();

        if (glfwGetKey(window, GLFW_KEY_ESCAPE) == GLFW_PRESS)
            glfwSetWindowShouldClose(window, 1);
        if (!io.WantCaptureKeyboard)
        {
            if (keyPressedOnce(GLFW_KEY_SPACE))
                paused = !paused;
            if (keyPressedOnce(GLFW_KEY_S))
                stepOnce = true;
        }

        if (!paused || stepOnce)
        {
            const int n = stepOnce ? 1 : ticksPerFrame;
            for (int i = 0; i < n; ++i)
                tank->step();
            stepOnce = false;

            const TankStats s = tank->stats();
            pushHist(static_cast<float>(s.population), static_cast<float>(s.agentEnergy));
        }

        ImGui_ImplOpenGL3_NewFrame();
        ImGui_ImplGlfw_NewFrame();
        ImGui::NewFrame();

        // ---- tank view
        ImGui::SetNextWindowPos(ImVec2(10, 10), ImGuiCond_FirstUseEver);
        ImGui::SetNextWindowSize(ImVec2(1000, 620), ImGuiCond_FirstUseEver);
        ImGui::Begin("Tank");
        {
            const ImVec2 origin = ImGui::GetCursorScreenPos();
            const ImVec2 avail  = ImGui::GetContentRegionAvail();
            const Bounds b      = tank->bounds();
            const float  scale  = std::max(0.05f, std::min(avail.x / b.width(), avail.y / b.height()));

            auto toScreen = [&](const Vec2 p)
            {
                return ImVec2(origin.x + (p.x - b.min.x) * scale, origin.y + (p.y - b.min.y) * scale);
            };

            ImDrawList *dl = ImGui::GetWindowDrawList();
            dl->AddRectFilled(origin, ImVec2(origin.x + b.width() * scale, origin.y + b.height() * scale),
                              IM_COL32(8, 24, 40, 255));

            for (const auto &f : tank->food())
                dl->AddCircleFilled(toScreen(f.position), 2.5f, IM_COL32(120, 200, 90, 255));

            for (const auto &a : tank->agents())
            {
                const ImVec2 c = toScreen(a->position());
                const float  r = 6.f * a->size();
                dl->AddCircleFilled(c, r, stageColor(*a));
                if (const EnergyLedger *e = a->energy())
                    dl->AddLine(ImVec2(c.x - r, c.y - r - 3), ImVec2(c.x - r + 2 * r * static_cast<float>(e->ratio()),
                                                                    c.y - r - 3),
                                e->isLow() ? IM_COL32(230, 70, 60, 255) : IM_COL32(80, 230, 120, 255), 2.f);
                if (selected && *selected == a->id())
                    dl->AddCircle(c, r + 4.f, IM_COL32_WHITE, 0, 1.5f);
            }

            ImGui::InvisibleButton("tank", ImVec2(b.width() * scale, b.height() * scale));
            if (ImGui::IsItemClicked())
            {
                const ImVec2 m = ImGui::GetIO().MousePos;
                float        best = 18.f * 18.f;
                selected.reset();
                for (const auto &a : tank->agents())
                {
                    const ImVec2 c  = toScreen(a->position());
                    const float  dx = m.x - c.x;
                    const float  dy = m.y - c.y;
                    if (const float d2 = dx * dx + dy * dy; d2 < best)
                    {
                        best     = d2;
                        selected = a->id();
                    }
                }
            }
        }
        ImGui::End();

        // ---- controls
        ImGui::SetNextWindowPos(ImVec2(1020, 10), ImGuiCond_FirstUseEver);
        ImGui::Begin("Aquarium");

        ImGui::Text("SPACE pause | S step | click a fish to inspect");
        ImGui::Separator();

        if (ImGui::Button(paused ? "Run" : "Pause"))
            paused = !paused;
        ImGui::SameLine();
        if (ImGui::Button("Step"))
            stepOnce = true;
        ImGui::SameLine();
        if (ImGui::Button("Reset"))
        {
            try
            {
                cfg.validate();
                tank.emplace(cfg, seed);
                tank->seedInitial(initialPop);
                selected.reset();
                clearHist();
            }
            catch (const std::invalid_argument &e)
            {
                logger()->error("reset rejected: {}", e.what());
            }
        }

        ImGui::InputScalar("Seed", ImGuiDataType_U64, &seed);
        ImGui::SliderInt("Initial Pop", &initialPop, 0, 60);
        ImGui::SliderInt("Ticks/frame", &ticksPerFrame, 1, 20);

        if (ImGui::CollapsingHeader("Config (applied on reset)"))
        {
            ImGui::SliderInt("Max population", &cfg.ecosystem.maxPopulation, 10, 200);
            ImGui::SliderInt("Critical population", &cfg.ecosystem.criticalPopulation, 0, 20);
            ImGui::SliderFloat("Food chance", &cfg.ecosystem.foodSpawnChance, 0.f, 1.f, "%.2f");
            ImGui::SliderInt("Repro cooldown", &cfg.reproduction.cooldownTicks, 0, 1200);
            float bank = static_cast<float>(cfg.energy.bankMultiplier);
            if (ImGui::SliderFloat("Bank multiplier", &bank, 0.f, 6.f, "%.1f"))
                cfg.energy.bankMultiplier = bank;
        }

        ImGui::InputText("File", savePath, sizeof(savePath));
        if (ImGui::Button("Save"))
        {
            if (!tank->save(savePath))
                logger()->error("could not save to {}", savePath);
        }
        ImGui::SameLine();
        if (ImGui::Button("Load"))
        {
            if (tank->load(savePath))
            {
                selected.reset();
                clearHist();
            }
            else
                logger()->error("could not load {}", savePath);
        }

        ImGui::Separator();

        const TankStats s = tank->stats();
        ImGui::Text("Tick %llu  Population %zu (fish %zu)  Food %zu", static_cast<unsigned long long>(s.tick),
                    s.population, s.fish, s.food);
        ImGui::Text("Energy: agents %.1f  banked %.1f  food %.1f  lost %.1f", s.agentEnergy, s.bankedEnergy,
                    s.foodEnergy, s.lostEnergy);
        ImGui::Text("Births %llu  Deaths %llu", static_cast<unsigned long long>(s.births),
                    static_cast<unsigned long long>(s.deaths));
        const Diagnostics &diag = tank->diagnostics();
        ImGui::Text("Speed: mean %.2f  max %.2f  stationary %llu", diag.meanSpeed(), diag.maxSpeed(),
                    static_cast<unsigned long long>(diag.stationarySamples()));
        for (int c = 1; c < static_cast<int>(s.deathsByCause.size()); ++c)
            ImGui::Text("  %s: %llu", toString(static_cast<DeathCause>(c)).data(),
                        static_cast<unsigned long long>(s.deathsByCause[static_cast<size_t>(c)]));

        static float popPlot[HISTORY];
        static float energyPlot[HISTORY];
        for (int i = 0; i < HISTORY; ++i)
        {
            const int idx = (histHead + i) % HISTORY;
            popPlot[i]    = histPop[idx];
            energyPlot[i] = histEnergy[idx];
        }
        ImGui::PlotLines("Pop", popPlot, HISTORY, 0, nullptr, 0.f,
                         static_cast<float>(tank->config().ecosystem.maxPopulation), ImVec2(0, 70));
        ImGui::PlotLines("Energy", energyPlot, HISTORY, 0, nullptr, 0.f, FLT_MAX, ImVec2(0, 70));

        if (ImGui::TreeNode("Reproduction"))
        {
            const ReproductionDebugInfo &d = tank->reproduction().debugInfo();
            ImGui::Text("asexual checks %llu  triggered %llu", static_cast<unsigned long long>(d.asexualChecks),
                        static_cast<unsigned long long>(d.asexualTriggered));
            ImGui::Text("banked %llu  sexual %llu  solo %llu", static_cast<unsigned long long>(d.bankedSpawns),
                        static_cast<unsigned long long>(d.sexualSpawns),
                        static_cast<unsigned long long>(d.soloSpawns));
            ImGui::Text("emergency %llu  rejected %llu", static_cast<unsigned long long>(d.emergencySpawns),
                        static_cast<unsigned long long>(d.rejectedSpawns));
            if (d.lastEmergencyTick)
                ImGui::Text("last emergency at tick %llu", static_cast<unsigned long long>(*d.lastEmergencyTick));
            ImGui::TreePop();
        }

        if (ImGui::TreeNode("Energy flow (last 60 ticks)"))
        {
            const EnergyBreakdown recent = tank->tracker().recentBreakdown(60);
            for (const auto &[src, v] : recent.gains)
                ImGui::Text("+ %-24s %.2f", src.c_str(), v);
            for (const auto &[src, v] : recent.burns)
                ImGui::Text("- %-24s %.2f", src.c_str(), v);
            ImGui::TreePop();
        }

        ImGui::Separator();
        Agent *sel = selected ? tank->findAgent(*selected) : nullptr;
        if (sel)
        {
            ImGui::Text("Selected: #%llu (%s, %s)", static_cast<unsigned long long>(sel->id()),
                        toString(sel->kind()).data(), sel->species().c_str());
            ImGui::Text("Generation %u  parent %s", sel->generation(),
                        sel->parentId() ? std::to_string(*sel->parentId()).c_str() : "-");

            if (const EnergyLedger *e = sel->energy())
                ImGui::Text("Energy %.1f / %.1f (%s)", e->current(), e->max(), e->statusLabel().data());
            if (const LifecycleStateMachine *l = sel->lifecycle())
                ImGui::Text("Stage %s  age %lld/%lld  size %.2f", l->stageName().data(),
                            static_cast<long long>(l->age()), static_cast<long long>(l->maxAge()), l->size());
            if (const ReproductionLedger *r = sel->reproduction())
            {
                ImGui::Text("%s", r->stateLabel().c_str());
                ImGui::Text("Bank %.1f  credits %.1f", r->overflowBank(), r->reproCredits());
            }
            if (const Mortality *m = sel->mortality())
                ImGui::Text("State %s", toString(m->state()).data());

            const Genome &g = sel->genome();
            ImGui::Text("Genes: size %.2f  lifespan %.2f  metabolism %.2f  asexual %.3f", g.sizeModifier,
                        g.lifespanModifier, g.metabolismModifier, g.asexualChance);

            if (ImGui::Button("+5 credits"))
                tank->grantReproCredits(sel->id(), 5.0);
            ImGui::SameLine();
            if (ImGui::Button("Predator"))
                tank->markPredatorEncounter(sel->id());
            ImGui::SameLine();
            if (ImGui::Button("Migrate"))
                tank->migrate(sel->id());

            if (ImGui::Button("Win vs nearest"))
            {
                if (Agent *mate = nearestMate(*tank, *sel))
                {
                    InteractionOutcome outcome;
                    outcome.participants = {sel->id(), mate->id()};
                    outcome.winner       = sel->id();
                    if (const auto baby = tank->applyInteraction(outcome))
                        logger()->info("interaction produced baby {}", *baby);
                }
            }
            ImGui::SameLine();
            if (ImGui::Button("Solo win"))
            {
                if (const auto baby = tank->applySoloWin(sel->id()))
                    logger()->info("solo win produced baby {}", *baby);
            }
        }
        else
        {
            ImGui::Text("Selected: none");
        }

        ImGui::End();

        ImGui::Render();

        int w, h;
        glfwGetFramebufferSize(window, &w, &h);
        glViewport(0, 0, w, h);
        glClearColor(0.02f, 0.02f, 0.03f, 1.f);
        glClear(GL_COLOR_BUFFER_BIT);
        ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());

        glfwSwapBuffers(window);

        // console stats ~1sec
        const double now = glfwGetTime();
        statTimer += now - lastTime;
        lastTime = now;
        if (statTimer > 1.0)
        {
            statTimer = 0.0;
            logger()->info("tick {} | population {} | food {} | births {} | deaths {}{}", s.tick, s.population,
                           s.food, s.births, s.deaths, paused ? " [PAUSED]" : "");
        }
    }

    ImGui_ImplOpenGL3_Shutdown();
    ImGui_ImplGlfw_Shutdown();
    ImGui::DestroyContext();

    glfwDestroyWindow(window);
    glfwTerminate();
    return 0;
}
